//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef DUA_FORMATTER_HPP
#define DUA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Durations and counts
 * - Colors
 * - JSON reports
 */

#include "dua/analyzers/analyzer.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace dua::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

        [[nodiscard]] std::string render() const;

        void render(std::ostream& out) const;

        void set_show_headers(bool show) { show_headers_ = show; }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        bool show_headers_ = true;
    };

    /**
     * Formats a duration for display.
     */
    [[nodiscard]] std::string format_duration(analyzers::Duration d);

    /**
     * Formats a count with comma separators.
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    [[nodiscard]] std::string colorize_severity(analyzers::Severity severity);

    /**
     * Text printer for analysis results.
     */
    class ReportPrinter {
    public:
        explicit ReportPrinter(std::ostream& out);

        /**
         * Prints one aligned row per diagnostic, in report order.
         */
        void print_diagnostics(const std::vector<analyzers::Diagnostic>& diagnostics) const;

        /**
         * Prints totals: reported, considered, exempted, duration.
         */
        void print_summary(const analyzers::AnalysisResult& result) const;

        /**
         * Prints exemption counts per rule and malformed-input counters.
         */
        void print_details(const analyzers::AnalysisResult& result) const;

        void print_rules(const std::vector<analyzers::IAnalyzer*>& registered) const;

    private:
        std::ostream& out_;
    };

    /**
     * JSON output helpers.
     */
    namespace json {

        [[nodiscard]] nlohmann::json diagnostic_to_json(const analyzers::Diagnostic& diagnostic);

        [[nodiscard]] nlohmann::json stats_to_json(const analysis::TrackerStats& stats);

        [[nodiscard]] nlohmann::json report_to_json(const analyzers::AnalysisResult& result);

        [[nodiscard]] nlohmann::json rules_to_json(const std::vector<analyzers::IAnalyzer*>& registered);

        /**
         * Converts an analysis result to a JSON string.
         */
        [[nodiscard]] std::string to_json(const analyzers::AnalysisResult& result, bool pretty = true);

    }  // namespace json
}  // namespace dua::cli

#endif //DUA_FORMATTER_HPP
