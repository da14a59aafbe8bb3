//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef DUA_ANALYZER_HPP
#define DUA_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Analyzer interface, rule descriptors and diagnostics.
 *
 * Analyzers consume the bound program and report unused declarations:
 * - UnusedFieldAnalyzer (DUA0001): private fields, whole-program scope
 * - UnusedParameterAnalyzer (DUA0002): parameters, single-body scope
 *
 * Diagnostics are the only output of the analysis. They carry everything
 * the serializers and the code-fix layer need (location, name, kind,
 * sibling group), so neither has to revisit the program.
 */

#include "dua/result.hpp"
#include "dua/error.hpp"
#include "dua/types.hpp"
#include "dua/config/config.hpp"
#include "dua/analysis/usage_tracker.hpp"
#include "dua/frontend/program.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dua::analyzers {

    using Duration = std::chrono::nanoseconds;

    enum class Severity {
        Hidden,
        Info,
        Warning,
        Error
    };

    [[nodiscard]] const char* to_string(Severity severity) noexcept;

    /**
     * Static description of a rule.
     *
     * Message formats take the declaration name as `{0}`. The write-only
     * format is used when the declaration was assigned somewhere.
     */
    struct RuleDescriptor {
        std::string_view id;
        std::string_view title;
        std::string_view message_format;
        std::string_view write_only_message_format;
        std::string_view category;
        Severity severity = Severity::Warning;
        bool enabled_by_default = true;
        std::string_view description;
    };

    /**
     * Formats a rule message for a declaration.
     */
    [[nodiscard]] std::string format_message(
        const RuleDescriptor& rule,
        std::string_view name,
        const UsageRecord& usage
    );

    /**
     * One reported unused declaration.
     */
    struct Diagnostic {
        std::string rule_id;
        Severity severity = Severity::Warning;
        std::string message;

        std::string name;
        SymbolKey symbol;
        DeclarationKind kind = DeclarationKind::Field;
        SourceLocation location;
        std::optional<std::string> sibling_group;
        UsageRecord usage;
    };

    /**
     * Builds the diagnostic for a finalized unused declaration.
     */
    [[nodiscard]] Diagnostic make_diagnostic(
        const RuleDescriptor& rule,
        const analysis::UnusedDeclaration& unused
    );

    /**
     * Report order: (location, rule id, name).
     */
    [[nodiscard]] bool diagnostic_order(const Diagnostic& a, const Diagnostic& b);

    struct AnalysisOptions {
        config::UsageConfig config = config::UsageConfig::defaults();
    };

    struct AnalysisResult {
        std::vector<Diagnostic> diagnostics;

        analysis::TrackerStats stats;
        std::size_t declarations_seen = 0;
        std::size_t declarations_exempted = 0;

        /// Exempted declarations per policy rule name
        std::map<std::string, std::size_t> exemptions;

        Duration analysis_duration = Duration::zero();

        /**
         * Appends another analyzer's result.
         */
        void merge(AnalysisResult other);
    };

    /**
     * Base interface for all analyzers.
     */
    class IAnalyzer {
    public:
        virtual ~IAnalyzer() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual const RuleDescriptor& rule() const noexcept = 0;

        /**
         * Analyzes a bound program.
         *
         * @param program The front-end's program model.
         * @param options Analysis options.
         * @return Diagnostics in report order, or an error.
         */
        [[nodiscard]] virtual Result<AnalysisResult, Error> analyze(
            const frontend::Program& program,
            const AnalysisOptions& options
        ) const = 0;
    };

    /**
     * Registry for managing analyzers.
     */
    class AnalyzerRegistry {
    public:
        static AnalyzerRegistry& instance();

        /**
         * Registers an analyzer, replacing one with the same name.
         */
        void register_analyzer(std::unique_ptr<IAnalyzer> analyzer);

        [[nodiscard]] IAnalyzer* get_analyzer(std::string_view name) const;
        [[nodiscard]] IAnalyzer* find_by_rule(std::string_view rule_id) const;
        [[nodiscard]] std::vector<IAnalyzer*> list_analyzers() const;

    private:
        AnalyzerRegistry() = default;
        std::vector<std::unique_ptr<IAnalyzer>> analyzers_;
    };

    /**
     * Runs every registered analyzer whose rule is enabled.
     *
     * An analyzer failure aborts the run: a partial unused-declaration
     * report is never returned.
     */
    [[nodiscard]] Result<AnalysisResult, Error> run_full_analysis(
        const frontend::Program& program,
        const AnalysisOptions& options = {}
    );

}  // namespace dua::analyzers

#endif //DUA_ANALYZER_HPP
