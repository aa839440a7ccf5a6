// include/cli.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ingest_config.hpp"

namespace MailIngest {
namespace Cli {

const int EXIT_OK = 0;
const int EXIT_USAGE = 1;
const int EXIT_RUNTIME = 2;

struct UsageError : std::runtime_error {
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

struct CommandLine {
    std::string command;
    std::vector<std::string> args;
    std::string config_path;
    std::optional<size_t> chunk_size_mb;
    std::optional<std::string> output_dir;
    std::optional<std::string> db_path;
    std::optional<size_t> workers;
    std::optional<std::string> order;
    std::optional<std::string> output_path;
    bool strict = false;
    bool help = false;
};

// Throws UsageError for unknown options, bad values and a missing command.
CommandLine parseCommandLine(int argc, const char* const argv[]);

// Config file and environment first, then the command-line overrides.
Config::IngestConfig buildConfig(const CommandLine& cl);

// Runs one subcommand; returns the exit code and leaves the result document in out.
int runCommand(const CommandLine& cl, const Config::IngestConfig& config, nlohmann::json& out);

// Whole command: parse, configure, run, then write the JSON result to
// out (or to --output). Diagnostics go to err.
int run(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

// Asks the pipeline of the running command, if any, to stop. Signal-safe.
void interruptActivePipeline();

} // namespace Cli
} // namespace MailIngest
