//
// Created by gregorian-rayne on 2/14/26.
//

#include "dua/cli/formatter.hpp"
#include "dua/version.hpp"

#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace dua::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        namespace {
            bool is_tty() {
#ifdef _WIN32
                return _isatty(_fileno(stdout)) != 0;
#else
                return isatty(fileno(stdout)) != 0;
#endif
            }
        }

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_duration(const analyzers::Duration d) {
        auto ns = d.count();
        if (ns < 0) ns = 0;

        const auto us = ns / 1000;
        const auto ms = us / 1000;
        const auto seconds = ms / 1000;

        std::ostringstream ss;

        if (seconds > 0) {
            ss << seconds << "." << std::setfill('0') << std::setw(2) << ((ms % 1000) / 10) << "s";
        } else if (ms > 0) {
            ss << ms << "." << ((us % 1000) / 100) << "ms";
        } else if (us > 0) {
            ss << us << "us";
        } else {
            ss << ns << "ns";
        }

        return ss.str();
    }

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    std::string colorize_severity(const analyzers::Severity severity) {
        const std::string label = analyzers::to_string(severity);
        if (!colors::enabled()) {
            return label;
        }

        switch (severity) {
            case analyzers::Severity::Error:
                return std::string(colors::RED) + colors::BOLD + label + colors::RESET;
            case analyzers::Severity::Warning:
                return std::string(colors::YELLOW) + label + colors::RESET;
            case analyzers::Severity::Info:
                return std::string(colors::CYAN) + label + colors::RESET;
            case analyzers::Severity::Hidden:
                return std::string(colors::DIM) + label + colors::RESET;
        }
        return label;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        // Pad row to match column count
        while (row.size() < columns_.size()) {
            row.push_back("");
        }
        rows_.push_back(std::move(row));
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        // Make a mutable copy to calculate widths
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                const bool last = i + 1 == temp.columns_.size();
                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else if (last) {
                    out << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (!last) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            header.reserve(temp.columns_.size());
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);

            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i + 1 < temp.columns_.size()) {
                    out << "  ";
                }
            }
            out << "\n";
        }

        for (const auto& row : temp.rows_) {
            render_row(row);
        }
    }

    // ============================================================================
    // ReportPrinter Implementation
    // ============================================================================

    ReportPrinter::ReportPrinter(std::ostream& out)
        : out_(out)
    {}

    void ReportPrinter::print_diagnostics(const std::vector<analyzers::Diagnostic>& diagnostics) const {
        for (const auto& d : diagnostics) {
            out_ << format_location(d.location) << ": "
                 << colorize_severity(d.severity) << " " << d.rule_id << ": "
                 << d.message << "\n";
        }
    }

    void ReportPrinter::print_summary(const analyzers::AnalysisResult& result) const {
        const auto count = result.diagnostics.size();
        if (count == 0) {
            if (colors::enabled()) {
                out_ << colors::GREEN << "No unused declarations found" << colors::RESET;
            } else {
                out_ << "No unused declarations found";
            }
        } else {
            out_ << format_count(count) << (count == 1 ? " unused declaration" : " unused declarations");
        }

        out_ << " (" << format_count(result.declarations_seen) << " considered, "
             << format_count(result.declarations_exempted) << " exempt, "
             << format_duration(result.analysis_duration) << ")\n";
    }

    void ReportPrinter::print_details(const analyzers::AnalysisResult& result) const {
        if (!result.exemptions.empty()) {
            Table exemptions({
                {"Exemption", 0, false},
                {"Count", 0, true}
            });
            for (const auto& [rule, count] : result.exemptions) {
                exemptions.add_row({rule, format_count(count)});
            }
            out_ << "\n";
            exemptions.render(out_);
        }

        const auto& stats = result.stats;
        Table counters({
            {"Tracker counter", 0, false},
            {"Count", 0, true}
        });
        counters.add_row({"declarations", format_count(stats.declarations)});
        counters.add_row({"occurrences", format_count(stats.occurrences)});
        counters.add_row({"duplicate declarations", format_count(stats.duplicate_declarations)});
        counters.add_row({"conflicting declarations", format_count(stats.conflicting_declarations)});
        counters.add_row({"scope mismatches", format_count(stats.scope_mismatches)});
        counters.add_row({"unknown ids", format_count(stats.unknown_ids)});
        counters.add_row({"orphan occurrences", format_count(stats.orphan_occurrences)});
        counters.add_row({"late events", format_count(stats.late_events)});

        out_ << "\n";
        counters.render(out_);
    }

    void ReportPrinter::print_rules(const std::vector<analyzers::IAnalyzer*>& registered) const {
        Table table({
            {"Rule", 0, false},
            {"Severity", 0, false},
            {"Category", 0, false},
            {"Analyzer", 0, false},
            {"Title", 0, false}
        });

        for (const auto* analyzer : registered) {
            const auto& rule = analyzer->rule();
            table.add_row({
                std::string(rule.id),
                analyzers::to_string(rule.severity),
                std::string(rule.category),
                std::string(analyzer->name()),
                std::string(rule.title)
            });
        }

        table.render(out_);
    }

    // ============================================================================
    // JSON
    // ============================================================================

    namespace json {

        nlohmann::json diagnostic_to_json(const analyzers::Diagnostic& diagnostic) {
            nlohmann::json j = {
                {"rule_id", diagnostic.rule_id},
                {"severity", analyzers::to_string(diagnostic.severity)},
                {"message", diagnostic.message},
                {"name", diagnostic.name},
                {"symbol", diagnostic.symbol},
                {"kind", to_string(diagnostic.kind)},
                {"file", diagnostic.location.file},
                {"line", diagnostic.location.line},
                {"column", diagnostic.location.column},
                {"has_write", diagnostic.usage.has_write}
            };
            if (diagnostic.sibling_group) {
                j["sibling_group"] = *diagnostic.sibling_group;
            } else {
                j["sibling_group"] = nullptr;
            }
            return j;
        }

        nlohmann::json stats_to_json(const analysis::TrackerStats& stats) {
            return {
                {"declarations", stats.declarations},
                {"occurrences", stats.occurrences},
                {"duplicate_declarations", stats.duplicate_declarations},
                {"conflicting_declarations", stats.conflicting_declarations},
                {"scope_mismatches", stats.scope_mismatches},
                {"unknown_ids", stats.unknown_ids},
                {"orphan_occurrences", stats.orphan_occurrences},
                {"late_events", stats.late_events}
            };
        }

        nlohmann::json report_to_json(const analyzers::AnalysisResult& result) {
            nlohmann::json diagnostics = nlohmann::json::array();
            for (const auto& diagnostic : result.diagnostics) {
                diagnostics.push_back(diagnostic_to_json(diagnostic));
            }

            nlohmann::json exemptions = nlohmann::json::object();
            for (const auto& [rule, count] : result.exemptions) {
                exemptions[rule] = count;
            }

            return {
                {"dua_version", VERSION_STRING},
                {"diagnostics", std::move(diagnostics)},
                {"summary", {
                    {"reported", result.diagnostics.size()},
                    {"declarations_seen", result.declarations_seen},
                    {"declarations_exempted", result.declarations_exempted},
                    {"exemptions", std::move(exemptions)},
                    {"analysis_duration_ns", result.analysis_duration.count()}
                }},
                {"stats", stats_to_json(result.stats)}
            };
        }

        nlohmann::json rules_to_json(const std::vector<analyzers::IAnalyzer*>& registered) {
            nlohmann::json rules = nlohmann::json::array();
            for (const auto* analyzer : registered) {
                const auto& rule = analyzer->rule();
                rules.push_back({
                    {"id", std::string(rule.id)},
                    {"title", std::string(rule.title)},
                    {"category", std::string(rule.category)},
                    {"severity", analyzers::to_string(rule.severity)},
                    {"enabled_by_default", rule.enabled_by_default},
                    {"analyzer", std::string(analyzer->name())},
                    {"message_format", std::string(rule.message_format)},
                    {"description", std::string(rule.description)}
                });
            }
            return rules;
        }

        std::string to_json(const analyzers::AnalysisResult& result, const bool pretty) {
            return report_to_json(result).dump(pretty ? 2 : -1);
        }

    }  // namespace json
}  // namespace dua::cli
