//
// Created by gregorian-rayne on 2/21/26.
//

#include "gcs/cli/commands/command.hpp"
#include "gcs/cli/commands/stats_command.hpp"
#include "gcs/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    constexpr auto kDefaultCommand = "authors";

    void print_help() {
        std::cout << gcs::PROJECT_NAME << " " << gcs::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << gcs::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : gcs::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nWithout a command, '" << kDefaultCommand << "' is run.\n";
        std::cout << "Run '" << gcs::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

    void print_version() {
        std::cout << gcs::PROJECT_SHORT_NAME << " " << gcs::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    using namespace gcs::cli;

    std::vector<std::string> args(argv + 1, argv + argc);

    if (!args.empty() && (args.front() == "--help" || args.front() == "-h" || args.front() == "help")) {
        print_help();
        return kExitOk;
    }
    if (!args.empty() && (args.front() == "--version" || args.front() == "-V")) {
        print_version();
        return kExitOk;
    }

    std::string command_name = kDefaultCommand;
    if (!args.empty() && !args.front().starts_with("-")) {
        if (CommandRegistry::instance().find(args.front())) {
            command_name = args.front();
            args.erase(args.begin());
        }
    }

    Command* cmd = CommandRegistry::instance().find(command_name);
    if (!cmd) {
        std::cerr << "error: unknown command '" << command_name << "'\n";
        return kExitUsage;
    }

    try {
        auto [parsed, error, success] = parse_arguments(args, cmd->arguments());
        if (!success) {
            std::cerr << "error: " << error << "\n";
            std::cerr << cmd->usage() << "\n";
            return kExitUsage;
        }

        if (parsed.get_flag("help")) {
            cmd->print_help();
            return kExitOk;
        }

        if (const std::string invalid = cmd->validate(parsed); !invalid.empty()) {
            std::cerr << "error: " << invalid << "\n";
            std::cerr << cmd->usage() << "\n";
            return kExitUsage;
        }

        return cmd->execute(parsed);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}
