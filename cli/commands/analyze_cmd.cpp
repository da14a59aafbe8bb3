//
// Created by gregorian-rayne on 2/14/26.
//

#include "dua/cli/commands/command.hpp"
#include "dua/cli/formatter.hpp"

#include "dua/dua.hpp"
#include "dua/utils/json_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace dua::cli
{
    namespace fs = std::filesystem;

    /**
     * Analyze command - reports unused fields and parameters of a program model.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Report private fields and parameters whose value is never read";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: dua analyze [OPTIONS] <program.json...>\n"
                   "\n"
                   "Exit status is 0 when nothing is reported, 2 when unused\n"
                   "declarations were reported and 1 on error.\n"
                   "\n"
                   "Examples:\n"
                   "  dua analyze model/*.json\n"
                   "  dua analyze --config dua.toml --disable DUA0002 model.json\n"
                   "  dua analyze --json --output report.json models/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
                {"output", 'o', "Output file for results", false, true, "", "FILE"},
                {"format", 'f', "Output format (text, json)", false, true, "text", "FORMAT"},
                {"parallel", 'j', "Number of worker threads (0=auto)", false, true, "", "N"},
                {"disable", 'd', "Disable a rule by id (repeatable)", false, true, "", "RULE", true},
                {"enable", 'e', "Enable a rule that is off by default (repeatable)", false, true, "", "RULE", true},
                {"fields-only", 0, "Only report unused private fields", false, false, "", ""},
                {"parameters-only", 0, "Only report unused parameters", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No program model specified. Use 'dua analyze <program.json...>'";
            }
            if (const auto format = args.get_or("format", "text"); format != "text" && format != "json") {
                return "Unknown output format: " + format;
            }
            if (args.get_flag("fields-only") && args.get_flag("parameters-only")) {
                return "--fields-only and --parameters-only are mutually exclusive";
            }
            if (args.has("parallel")) {
                if (const auto threads = args.get_int("parallel"); !threads || *threads < 0) {
                    return "--parallel expects a non-negative integer";
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            configure_output(args);

            auto options = load_options(args);
            if (options.is_err()) {
                print_error(options.error().to_string());
                return 1;
            }

            auto program = load_programs(args.positional());
            if (program.is_err()) {
                print_error(program.error().to_string());
                return 1;
            }

            print_verbose("Loaded " + std::to_string(program.value().units.size()) + " units, " +
                          std::to_string(program.value().callable_count()) + " callables");

            analyzers::register_all_analyzers();
            for (const auto* analyzer : analyzers::AnalyzerRegistry::instance().list_analyzers()) {
                const auto& rule = analyzer->rule();
                print_debug(std::string(analyzer->name()) + " (" + std::string(rule.id) + "): " +
                            (options.value().config.is_rule_enabled(rule.id, rule.enabled_by_default)
                                 ? "enabled" : "disabled"));
            }

            auto result = analyzers::run_full_analysis(program.value(), options.value());
            if (result.is_err()) {
                print_error(result.error().to_string());
                return 1;
            }
            const auto& report = result.value();

            if (const auto malformed = report.stats.malformed_events(); malformed > 0) {
                print_verbose("Dropped " + std::to_string(malformed) + " malformed events");
            }

            if (is_json()) {
                std::cout << json::to_json(report, true) << "\n";
            } else if (!is_quiet()) {
                ReportPrinter printer(std::cout);
                printer.print_diagnostics(report.diagnostics);
                printer.print_summary(report);
                if (is_verbose()) {
                    printer.print_details(report);
                }
            }

            if (auto output_file = args.get("output")) {
                if (!write_report(*output_file, report)) {
                    return 1;
                }
                print_verbose("Results written to " + *output_file);
            }

            return report.diagnostics.empty() ? 0 : 2;
        }

    private:
        [[nodiscard]] Result<analyzers::AnalysisOptions, Error> load_options(const ParsedArgs& args) const {
            analyzers::AnalysisOptions options;

            if (const auto config_file = args.get("config")) {
                print_debug("Reading configuration from " + *config_file);
                auto loaded = config::load_from_file(*config_file);
                if (loaded.is_err()) {
                    return Result<analyzers::AnalysisOptions, Error>::failure(loaded.error());
                }
                options.config = std::move(loaded).value();
            }

            auto& config = options.config;
            if (const auto threads = args.get_int("parallel")) {
                config.max_threads = static_cast<std::size_t>(*threads);
            }
            for (const auto& rule : args.get_all("disable")) {
                config.disabled_rules.push_back(rule);
            }
            for (const auto& rule : args.get_all("enable")) {
                config.enabled_rules.push_back(rule);
            }
            if (args.get_flag("fields-only")) {
                config.analyze_parameters = false;
            }
            if (args.get_flag("parameters-only")) {
                config.analyze_fields = false;
            }

            return Result<analyzers::AnalysisOptions, Error>::success(std::move(options));
        }

        [[nodiscard]] Result<frontend::Program, Error> load_programs(const std::vector<std::string>& inputs) const {
            std::vector<fs::path> model_files;
            for (const auto& path_str : inputs) {
                const fs::path path(path_str);

                if (std::error_code ec; fs::is_directory(path, ec)) {
                    // Scan directory for program models
                    for (const auto& entry : fs::recursive_directory_iterator(path, ec)) {
                        if (entry.is_regular_file() && entry.path().extension() == ".json") {
                            model_files.push_back(entry.path());
                        }
                    }
                } else {
                    model_files.push_back(path);
                }
            }

            if (model_files.empty()) {
                return Result<frontend::Program, Error>::failure(
                    Error::not_found("No program model files found"));
            }

            std::vector<frontend::Program> programs;
            programs.reserve(model_files.size());
            for (const auto& file : model_files) {
                print_debug("Loading " + file.string());
                auto program = frontend::load_program_from_file(file);
                if (program.is_err()) {
                    return program;
                }
                programs.push_back(std::move(program).value());
            }

            return Result<frontend::Program, Error>::success(frontend::merge_programs(std::move(programs)));
        }

        [[nodiscard]] bool write_report(const std::string& output_file, const analyzers::AnalysisResult& report) const {
            if (is_json()) {
                if (auto written = json_utils::write_file(output_file, json::report_to_json(report)); written.is_err()) {
                    print_error(written.error().to_string());
                    return false;
                }
                return true;
            }

            std::ofstream out(output_file);
            if (!out) {
                print_error("Failed to open output file: " + output_file);
                return false;
            }
            ReportPrinter printer(out);
            printer.print_diagnostics(report.diagnostics);
            printer.print_summary(report);
            return static_cast<bool>(out);
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace dua::cli
