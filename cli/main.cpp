//
// Created by gregorian-rayne on 2/14/26.
//

#include "dua/cli/commands/command.hpp"
#include "dua/version.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_version() {
        std::cout << dua::PROJECT_SHORT_NAME << " " << dua::VERSION_STRING
                  << " (" << dua::PROJECT_NAME << ")\n";
    }

    void print_help() {
        std::cout << dua::PROJECT_NAME << " " << dua::VERSION_STRING << "\n\n"
                  << "Usage: dua <command> [OPTIONS]\n\n"
                  << "Commands:\n";
        for (const auto* command : dua::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << command->name();
            for (auto pad = command->name().size(); pad < 12; ++pad) {
                std::cout << ' ';
            }
            std::cout << command->description() << "\n";
        }
        std::cout << "  help        Show help for a command\n\n"
                  << "Run 'dua help <command>' for command options.\n";
    }

    int run_command(dua::cli::Command& command, const std::vector<std::string>& args) {
        auto parsed = dua::cli::parse_arguments(args, command.arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            std::cerr << "Run 'dua help " << command.name() << "' for usage.\n";
            return 1;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto problem = command.validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n";
                return 1;
            }
        }

        return command.execute(parsed.args);
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        const std::vector<std::string> argv_list(argv + 1, argv + argc);

        if (argv_list.empty()) {
            print_help();
            return 1;
        }

        const std::string& first = argv_list.front();
        if (first == "--version" || first == "-V") {
            print_version();
            return 0;
        }

        auto& registry = dua::cli::CommandRegistry::instance();

        if (first == "help" || first == "--help" || first == "-h") {
            if (argv_list.size() > 1) {
                if (const auto* command = registry.find(argv_list[1])) {
                    command->print_help();
                    return 0;
                }
                std::cerr << "error: Unknown command: " << argv_list[1] << "\n";
                return 1;
            }
            print_help();
            return 0;
        }

        auto* command = registry.find(first);
        if (command == nullptr) {
            std::cerr << "error: Unknown command: " << first << "\n";
            print_help();
            return 1;
        }

        return run_command(*command, {argv_list.begin() + 1, argv_list.end()});

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
