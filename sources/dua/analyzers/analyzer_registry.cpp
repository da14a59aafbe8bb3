//
// Created by gregorian-rayne on 2/13/26.
//

#include "dua/analyzers/analyzer.hpp"

#include <algorithm>
#include <tuple>

namespace dua::analyzers
{
    const char* to_string(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Hidden:  return "hidden";
            case Severity::Info:    return "info";
            case Severity::Warning: return "warning";
            case Severity::Error:   return "error";
        }
        return "unknown";
    }

    std::string format_message(
        const RuleDescriptor& rule,
        const std::string_view name,
        const UsageRecord& usage
    ) {
        const std::string_view format = usage.has_write && !rule.write_only_message_format.empty()
            ? rule.write_only_message_format
            : rule.message_format;

        std::string message;
        message.reserve(format.size() + name.size());

        constexpr std::string_view placeholder = "{0}";
        std::size_t pos = 0;
        while (pos < format.size()) {
            const auto next = format.find(placeholder, pos);
            if (next == std::string_view::npos) {
                message.append(format.substr(pos));
                break;
            }
            message.append(format.substr(pos, next - pos));
            message.append(name);
            pos = next + placeholder.size();
        }
        return message;
    }

    Diagnostic make_diagnostic(const RuleDescriptor& rule, const analysis::UnusedDeclaration& unused) {
        const auto& declaration = unused.declaration;

        Diagnostic diagnostic;
        diagnostic.rule_id = std::string(rule.id);
        diagnostic.severity = rule.severity;
        diagnostic.message = format_message(rule, declaration.name, unused.usage);
        diagnostic.name = declaration.name;
        diagnostic.symbol = declaration.symbol;
        diagnostic.kind = declaration.kind;
        diagnostic.location = declaration.location;
        diagnostic.sibling_group = declaration.sibling_group;
        diagnostic.usage = unused.usage;
        return diagnostic;
    }

    bool diagnostic_order(const Diagnostic& a, const Diagnostic& b) {
        return std::tie(a.location, a.rule_id, a.name, a.symbol) <
               std::tie(b.location, b.rule_id, b.name, b.symbol);
    }

    void AnalysisResult::merge(AnalysisResult other) {
        diagnostics.insert(diagnostics.end(),
                           std::make_move_iterator(other.diagnostics.begin()),
                           std::make_move_iterator(other.diagnostics.end()));
        stats.merge(other.stats);
        declarations_seen += other.declarations_seen;
        declarations_exempted += other.declarations_exempted;
        for (const auto& [rule, count] : other.exemptions) {
            exemptions[rule] += count;
        }
    }

    AnalyzerRegistry& AnalyzerRegistry::instance() {
        static AnalyzerRegistry registry;
        return registry;
    }

    void AnalyzerRegistry::register_analyzer(std::unique_ptr<IAnalyzer> analyzer) {
        for (auto& existing : analyzers_) {
            if (existing->name() == analyzer->name()) {
                existing = std::move(analyzer);
                return;
            }
        }
        analyzers_.push_back(std::move(analyzer));
    }

    IAnalyzer* AnalyzerRegistry::get_analyzer(const std::string_view name) const {
        for (const auto& analyzer : analyzers_) {
            if (analyzer->name() == name) {
                return analyzer.get();
            }
        }
        return nullptr;
    }

    IAnalyzer* AnalyzerRegistry::find_by_rule(const std::string_view rule_id) const {
        for (const auto& analyzer : analyzers_) {
            if (analyzer->rule().id == rule_id) {
                return analyzer.get();
            }
        }
        return nullptr;
    }

    std::vector<IAnalyzer*> AnalyzerRegistry::list_analyzers() const {
        std::vector<IAnalyzer*> result;
        result.reserve(analyzers_.size());

        for (const auto& analyzer : analyzers_) {
            result.push_back(analyzer.get());
        }

        return result;
    }

    Result<AnalysisResult, Error> run_full_analysis(
        const frontend::Program& program,
        const AnalysisOptions& options
    ) {
        AnalysisResult combined_result;
        const auto start_time = std::chrono::steady_clock::now();

        for (const auto analyzers = AnalyzerRegistry::instance().list_analyzers(); const auto* analyzer : analyzers) {
            if (const auto& rule = analyzer->rule(); !options.config.is_rule_enabled(rule.id, rule.enabled_by_default)) {
                continue;
            }

            auto result = analyzer->analyze(program, options);
            if (result.is_err()) {
                return Result<AnalysisResult, Error>::failure(
                    result.error().with_context(std::string(analyzer->name())));
            }

            combined_result.merge(std::move(result).value());
        }

        std::sort(combined_result.diagnostics.begin(), combined_result.diagnostics.end(), diagnostic_order);

        const auto end_time = std::chrono::steady_clock::now();
        combined_result.analysis_duration = std::chrono::duration_cast<Duration>(end_time - start_time);

        return Result<AnalysisResult, Error>::success(std::move(combined_result));
    }

}  // namespace dua::analyzers
