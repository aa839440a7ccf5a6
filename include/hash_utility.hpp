// include/hash_utility.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <openssl/sha.h>

namespace MailIngest
{
    namespace Hashing
    {

        // Incremental SHA-256 over an arbitrary sequence of byte ranges.
        class Sha256Stream
        {
        public:
            Sha256Stream();

            void update(const char *data, size_t size);
            void update(const std::string &data) { update(data.data(), data.size()); }

            // Finalize and return the lowercase hex digest. The stream cannot be reused.
            std::string hexDigest();

        private:
            SHA256_CTX ctx;
            bool finished;
        };

        class HashUtility
        {
        public:
            // SHA-256 of an in-memory buffer as a hex string.
            static std::string generateSHA256(const std::string &data);

            // SHA-256 of a file, read in blocks of buffer_size bytes.
            static std::string hashFile(const std::filesystem::path &file_path, size_t buffer_size = 64 * 1024);
        };

    } // namespace Hashing
} // namespace MailIngest
