//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cli/commands/command.hpp"
#include "dsv/version.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << dsv::PROJECT_NAME << " " << dsv::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << dsv::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : dsv::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << cmd->name();
            for (std::size_t pad = cmd->name().size(); pad < 12; ++pad) {
                std::cout << ' ';
            }
            std::cout << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << dsv::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty() || args.front() == "--help" || args.front() == "-h" || args.front() == "help") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        if (args.front() == "--version" || args.front() == "version") {
            std::cout << dsv::PROJECT_NAME << " " << dsv::VERSION_STRING << "\n";
            return 0;
        }

        // A bare directory or option means "scan".
        const std::string command_name = dsv::cli::take_command_name(args, "scan");

        auto* command = dsv::cli::CommandRegistry::instance().find(command_name);
        if (!command) {
            std::cerr << "error: unknown command '" << command_name << "'\n";
            print_usage();
            return 1;
        }

        auto parsed = dsv::cli::parse_arguments(args, command->arguments());
        if (parsed.is_err()) {
            std::cerr << "error: " << parsed.error().to_string() << "\n\n" << command->usage() << "\n";
            return 1;
        }

        if (!parsed.value().get_flag("help")) {
            if (const auto problem = command->validate(parsed.value()); !problem.empty()) {
                std::cerr << "error: " << problem << "\n\n" << command->usage() << "\n";
                return 1;
            }
        }

        return command->execute(parsed.value());

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
