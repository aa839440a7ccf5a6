// src/cli.cpp
#include "cli.hpp"

#include <atomic>
#include <fstream>
#include <iostream>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Our project includes
#include "chunk_state_store.hpp"
#include "ingest_pipeline.hpp"
#include "mbox_splitter.hpp"
#include "thread_reconstructor.hpp"

namespace po = boost::program_options;
using nlohmann::json;

namespace MailIngest {
namespace Cli {

namespace {

std::atomic<IngestPipeline*> active_pipeline{nullptr};

// Makes a pipeline reachable from the SIGINT handler while it runs.
struct ActivePipeline {
    explicit ActivePipeline(IngestPipeline& pipeline) { active_pipeline = &pipeline; }
    ~ActivePipeline() { active_pipeline = nullptr; }
};

const char* COMMANDS =
    "Usage: mbox_ingest <command> [args] [options]\n"
    "Commands:\n"
    "  split <archive>      Split an archive into chunks and register them\n"
    "  process <archive>    Process the pending chunks of a split archive\n"
    "  threads <archive>    Process, then print the reconstructed threads\n"
    "  status [archive]     Chunk counts by status, and the chunks of an archive\n"
    "  reset <chunkId>      Return a completed or failed chunk to pending\n"
    "  log <chunkId>        Status transitions of a chunk\n"
    "  validate <archive>   Check the chunks on disk against the archive hash\n"
    "  clear                Delete every chunk record and log entry\n";

po::options_description visibleOptions() {
    po::options_description options("Options");
    options.add_options()
        ("help,h", "list commands and options")
        ("config", po::value<std::string>(), "JSON configuration file")
        ("chunk-size-mb", po::value<long long>(), "target chunk size in MB, 0 for a single chunk")
        ("output-dir", po::value<std::string>(), "directory for chunk files and manifests")
        ("db", po::value<std::string>(), "chunk state database")
        ("workers", po::value<long long>(), "chunks processed in parallel")
        ("order", po::value<std::string>(), "claim order: date or size")
        ("strict", po::bool_switch(), "fail a chunk on its first malformed message")
        ("output", po::value<std::string>(), "write the JSON result to this file instead of stdout");
    return options;
}

void printUsage(std::ostream& err) {
    err << COMMANDS << visibleOptions() << std::endl;
}

std::optional<size_t> countOption(const po::variables_map& vm, const char* name) {
    if (!vm.count(name)) {
        return std::nullopt;
    }
    long long value = vm[name].as<long long>();
    if (value < 0) {
        throw UsageError(std::string("--") + name + " must not be negative");
    }
    return static_cast<size_t>(value);
}

std::optional<std::string> stringOption(const po::variables_map& vm, const char* name) {
    if (!vm.count(name)) {
        return std::nullopt;
    }
    return vm[name].as<std::string>();
}

const std::string& requireArg(const CommandLine& cl, const char* what) {
    if (cl.args.empty()) {
        throw UsageError(cl.command + " requires " + what);
    }
    return cl.args.front();
}

json recordToJson(const State::ChunkRecord& record) {
    json j = record.metadata.toJson();
    j["archive"] = record.archive_path;
    j["status"] = Chunks::toString(record.status);
    j["resumeOffset"] = record.resume_offset ? json(*record.resume_offset) : json(nullptr);
    j["createdAt"] = record.created_at;
    j["processedAt"] = record.processed_at ? json(*record.processed_at) : json(nullptr);
    return j;
}

Threads::ThreadOptions threadOptions(const Config::IngestConfig& config) {
    Threads::ThreadOptions options;
    options.use_transport_thread_id = config.use_transport_thread_id;
    options.subject_match_window_days = config.subject_match_window_days;
    return options;
}

} // namespace

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    po::options_description hidden("Positional");
    hidden.add_options()
        ("command", po::value<std::string>(), "subcommand")
        ("args", po::value<std::vector<std::string>>(), "subcommand arguments");

    po::options_description all_options;
    all_options.add(visibleOptions()).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all_options).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    CommandLine cl;
    cl.help = vm.count("help") > 0;
    if (vm.count("command")) {
        cl.command = vm["command"].as<std::string>();
    }
    if (vm.count("args")) {
        cl.args = vm["args"].as<std::vector<std::string>>();
    }
    cl.config_path = stringOption(vm, "config").value_or("");
    cl.chunk_size_mb = countOption(vm, "chunk-size-mb");
    cl.output_dir = stringOption(vm, "output-dir");
    cl.db_path = stringOption(vm, "db");
    cl.workers = countOption(vm, "workers");
    cl.order = stringOption(vm, "order");
    cl.output_path = stringOption(vm, "output");
    cl.strict = vm["strict"].as<bool>();

    if (cl.command.empty() && !cl.help) {
        throw UsageError("No command given");
    }
    return cl;
}

Config::IngestConfig buildConfig(const CommandLine& cl) {
    Config::IngestConfig config = Config::IngestConfig::load(cl.config_path);
    if (cl.chunk_size_mb) config.chunk_size_mb = *cl.chunk_size_mb;
    if (cl.output_dir) config.chunk_output_dir = *cl.output_dir;
    if (cl.db_path) config.state_db_path = *cl.db_path;
    if (cl.workers) config.max_parallel_workers = *cl.workers;
    if (cl.order) {
        try {
            config.work_order = Chunks::workOrderFromString(*cl.order);
        } catch (const std::runtime_error& e) {
            throw UsageError(e.what());
        }
    }
    if (cl.strict) config.skip_malformed = false;
    config.validate();
    return config;
}

int runCommand(const CommandLine& cl, const Config::IngestConfig& config, json& out) {
    State::ChunkStateStore store(config.state_db_path);

    if (cl.command == "split") {
        IngestPipeline pipeline(config, store);
        ActivePipeline active(pipeline);
        Metadata::ArchiveManifest manifest = pipeline.splitArchive(requireArg(cl, "an archive path"));
        out = manifest.toJson();
        return EXIT_OK;
    }

    if (cl.command == "process" || cl.command == "threads") {
        const std::string& archive = requireArg(cl, "an archive path");
        IngestPipeline pipeline(config, store);
        Threads::ThreadReconstructor reconstructor(threadOptions(config));

        IngestSummary summary;
        {
            ActivePipeline active(pipeline);
            summary = pipeline.processArchive(archive, reconstructor);
        }

        std::vector<Threads::Thread> threads = reconstructor.buildThreads();
        out = summary.toJson();
        out["threadCount"] = threads.size();
        if (cl.command == "threads") {
            out["threads"] = json::array();
            for (const auto& thread : threads) {
                out["threads"].push_back(thread.toJson());
            }
        }
        return summary.chunks_failed == 0 && !summary.cancelled ? EXIT_OK : EXIT_RUNTIME;
    }

    if (cl.command == "status") {
        State::ChunkStats stats = store.getStats();
        out["stats"] = {{"total", stats.total}, {"pending", stats.pending}, {"processing", stats.processing},
                        {"completed", stats.completed}, {"failed", stats.failed}};
        if (!cl.args.empty()) {
            out["chunks"] = json::array();
            for (const auto& record : store.getByArchive(IngestPipeline::archiveKey(cl.args.front()))) {
                out["chunks"].push_back(recordToJson(record));
            }
        }
        return EXIT_OK;
    }

    if (cl.command == "reset") {
        const std::string& chunk_id = requireArg(cl, "a chunk id");
        bool reset = store.reset(chunk_id);
        out = {{"chunkId", chunk_id}, {"reset", reset}};
        return reset ? EXIT_OK : EXIT_RUNTIME;
    }

    if (cl.command == "log") {
        const std::string& chunk_id = requireArg(cl, "a chunk id");
        out = json::array();
        for (const auto& entry : store.getLog(chunk_id)) {
            out.push_back({{"id", entry.id},
                           {"status", Chunks::toString(entry.status)},
                           {"offset", entry.offset ? json(*entry.offset) : json(nullptr)},
                           {"error", entry.error ? json(*entry.error) : json(nullptr)},
                           {"timestamp", entry.timestamp}});
        }
        return EXIT_OK;
    }

    if (cl.command == "validate") {
        const std::string archive = IngestPipeline::archiveKey(requireArg(cl, "an archive path"));
        Split::MboxSplitter splitter(config.getOutputDirPath(), config.bufferSizeBytes());
        auto manifest = splitter.loadManifest(Split::MboxSplitter::archiveBaseName(archive));
        if (!manifest) {
            throw std::runtime_error("No manifest found for " + archive + " in " + config.chunk_output_dir);
        }
        bool valid = splitter.validateSplit(archive, manifest->chunkPaths());
        out = {{"archive", archive}, {"chunks", manifest->chunks.size()}, {"valid", valid}};
        return valid ? EXIT_OK : EXIT_RUNTIME;
    }

    if (cl.command == "clear") {
        store.clearAll();
        out = {{"cleared", true}};
        return EXIT_OK;
    }

    throw UsageError("Unknown command " + cl.command);
}

int run(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    CommandLine cl;
    Config::IngestConfig config;
    try {
        cl = parseCommandLine(argc, argv);
        if (cl.help) {
            printUsage(err);
            return EXIT_OK;
        }
        config = buildConfig(cl);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n";
        printUsage(err);
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        err << "Configuration error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    json result;
    int code = EXIT_OK;
    try {
        code = runCommand(cl, config, result);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n";
        printUsage(err);
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return EXIT_RUNTIME;
    }

    if (cl.output_path) {
        std::ofstream ofs(*cl.output_path);
        if (!ofs.is_open()) {
            err << "Error: cannot write " << *cl.output_path << std::endl;
            return EXIT_RUNTIME;
        }
        ofs << result.dump(4) << std::endl;
    } else {
        out << result.dump(4) << std::endl;
    }
    return code;
}

void interruptActivePipeline() {
    IngestPipeline* pipeline = active_pipeline.load();
    if (pipeline) {
        pipeline->cancel();
    }
}

} // namespace Cli
} // namespace MailIngest
