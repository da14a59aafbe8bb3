//
// Created by gregorian-rayne on 2/14/26.
//

#include "dua/cli/commands/command.hpp"
#include "dua/cli/formatter.hpp"

#include "dua/analyzers/all_analyzers.hpp"

#include <iostream>

namespace dua::cli
{
    /**
     * Rules command - lists the rules the analyzers report.
     */
    class RulesCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "rules";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List available rules";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: dua rules [--json]";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            configure_output(args);

            analyzers::register_all_analyzers();
            const auto registered = analyzers::AnalyzerRegistry::instance().list_analyzers();

            if (is_json()) {
                std::cout << json::rules_to_json(registered).dump(2) << "\n";
                return 0;
            }

            ReportPrinter printer(std::cout);
            printer.print_rules(registered);

            if (is_verbose()) {
                for (const auto* analyzer : registered) {
                    const auto& rule = analyzer->rule();
                    std::cout << "\n" << rule.id << ": " << rule.title << "\n"
                              << "  " << rule.description << "\n"
                              << "  message: " << rule.message_format << "\n";
                }
            }
            return 0;
        }
    };

    namespace {
        struct RulesCommandRegistrar {
            RulesCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<RulesCommand>()
                );
            }
        } rules_registrar;
    }
}  // namespace dua::cli
