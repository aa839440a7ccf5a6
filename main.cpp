// main.cpp
#include <csignal>
#include <iostream>
#include <ostream>

// Our project includes
#include "cli.hpp"

namespace {

void onInterrupt(int) {
    MailIngest::Cli::interruptActivePipeline();
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries only the JSON result; component progress lines go to stderr.
    std::ostream result_out(std::cout.rdbuf());
    std::streambuf* stdout_buf = std::cout.rdbuf(std::clog.rdbuf());

    std::signal(SIGINT, onInterrupt);
    int code = MailIngest::Cli::run(argc, argv, result_out, std::cerr);

    result_out.flush();
    std::cout.rdbuf(stdout_buf);
    return code;
}
