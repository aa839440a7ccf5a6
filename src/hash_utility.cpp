// src/hash_utility.cpp
#include "hash_utility.hpp"
#include <fstream>
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error
#include <vector>

// Ensure OpenSSL::Crypto is linked in CMakeLists.txt

namespace MailIngest
{
    namespace Hashing
    {

        Sha256Stream::Sha256Stream() : finished(false)
        {
            if (!SHA256_Init(&ctx))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
        }

        void Sha256Stream::update(const char *data, size_t size)
        {
            if (finished)
            {
                throw std::runtime_error("SHA256 stream already finalized.");
            }
            if (size == 0)
            {
                return;
            }
            if (!SHA256_Update(&ctx, data, size))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
        }

        std::string Sha256Stream::hexDigest()
        {
            if (finished)
            {
                throw std::runtime_error("SHA256 stream already finalized.");
            }
            unsigned char hash[SHA256_DIGEST_LENGTH];
            if (!SHA256_Final(hash, &ctx))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            finished = true;

            std::stringstream ss;
            for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }

        std::string HashUtility::generateSHA256(const std::string &data)
        {
            Sha256Stream stream;
            stream.update(data);
            return stream.hexDigest();
        }

        std::string HashUtility::hashFile(const std::filesystem::path &file_path, size_t buffer_size)
        {
            std::ifstream ifs(file_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open file for hashing: " + file_path.string());
            }

            Sha256Stream stream;
            std::vector<char> buffer(buffer_size == 0 ? 4096 : buffer_size);
            while (ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || ifs.gcount() > 0)
            {
                stream.update(buffer.data(), static_cast<size_t>(ifs.gcount()));
            }
            if (ifs.bad())
            {
                throw std::runtime_error("I/O error while hashing file: " + file_path.string());
            }
            return stream.hexDigest();
        }

    } // namespace Hashing
} // namespace MailIngest
