#include <cxxopts.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "fluent/Cli.hpp"

using namespace fluent;

int main(int argc, char** argv) {
    CliOptions cli;
    std::vector<std::string> command;

    try {
        cxxopts::Options options("fluent-cli", "Query JSON/TOML data with collection operations");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("i,input", "JSON/TOML data file (stdin JSON when omitted)", cxxopts::value<std::string>())
            ("p,path", "Dot-path of the collection inside the document", cxxopts::value<std::string>()->default_value(""))
            ("to", "Output format: json or toml", cxxopts::value<std::string>()->default_value("json"))
            ("indent", "JSON indentation (-1 for compact)", cxxopts::value<int>()->default_value("2"))
            ("s,strict", "Strict comparisons for like, in and unique")
            ("v,verbose", "Debug logging")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Command and its arguments", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: dump | keys | count [PATH] | where PATH [OP] VALUE | like PATH PATTERN |\n"
                         "          in PATH V1,V2,... | between PATH MIN MAX | sort [-]PATH... |\n"
                         "          sum|avg|min|max|median|mode [PATH] | unique [PATH] | first | last\n"
                         "Put '--' before the command when an argument starts with '-'.\n";
            return result.count("help") ? 0 : 2;
        }

        if (result.count("input")) cli.input = result["input"].as<std::string>();
        cli.path = result["path"].as<std::string>();
        cli.format = result["to"].as<std::string>();
        cli.indent = result["indent"].as<int>();
        cli.strict = result.count("strict") > 0;
        command = result["command"].as<std::vector<std::string>>();

        // stdout carries results; log to stderr
        spdlog::set_default_logger(spdlog::stderr_color_mt("fluent"));
        spdlog::set_level(result.count("verbose") ? spdlog::level::debug : spdlog::level::warn);
        spdlog::cfg::load_env_levels();
    } catch (const std::exception& ex) {
        std::cerr << "Usage error: " << ex.what() << "\n";
        return 2;
    }

    return run_command(cli, command, std::cin, std::cout, std::cerr);
}
