//
// Created by gregorian-rayne on 2/13/26.
//

#include "dua/analyzers/unused_field_analyzer.hpp"
#include "dua/analysis/exemption_policy.hpp"
#include "dua/analysis/usage_tracker.hpp"
#include "dua/utils/parallel.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace dua::analyzers
{
    namespace {

        constexpr RuleDescriptor UNUSED_FIELD_RULE{
            .id = "DUA0001",
            .title = "Unused private field",
            .message_format = "Private field '{0}' is never read",
            .write_only_message_format = "Private field '{0}' is assigned but its value is never read",
            .category = "Usage",
            .severity = Severity::Warning,
            .enabled_by_default = true,
            .description = "A private field whose value is never read anywhere in the program "
                           "can be removed together with its assignments."
        };

        /**
         * Declaration bookkeeping for one unit, merged after the join.
         */
        struct UnitSummary {
            std::size_t seen = 0;
            std::size_t exempted = 0;
            std::map<std::string, std::size_t> exemptions;
            std::vector<SymbolKey> exempt_symbols;
        };

        analysis::DeclarationCandidate make_candidate(
            const frontend::FieldSite& field,
            const frontend::SourceUnit& unit
        ) {
            analysis::DeclarationCandidate candidate;
            candidate.name = field.name;
            candidate.kind = DeclarationKind::Field;
            candidate.accessibility = field.accessibility;
            candidate.is_implicit = field.is_implicit;
            candidate.is_constant = field.is_constant;
            candidate.in_generated_code = unit.generated;
            return candidate;
        }

        UnitSummary screen_unit(const frontend::SourceUnit& unit, const analysis::IExemptionPolicy& policy) {
            UnitSummary summary;
            for (const auto& field : unit.fields) {
                ++summary.seen;
                if (const auto reason = policy.exemption_reason(make_candidate(field, unit))) {
                    ++summary.exempted;
                    ++summary.exemptions[std::string(*reason)];
                    summary.exempt_symbols.push_back(field.symbol);
                }
            }
            return summary;
        }

        void feed_unit(
            const frontend::SourceUnit& unit,
            const analysis::IExemptionPolicy& policy,
            const std::unordered_set<SymbolKey>& exempt,
            analysis::UsageTracker& tracker
        ) {
            analysis::ProducerScope producer(tracker);

            for (const auto& field : unit.fields) {
                if (!policy.should_track(make_candidate(field, unit))) {
                    continue;
                }

                Declaration declaration;
                declaration.symbol = field.symbol;
                declaration.name = field.name;
                declaration.kind = DeclarationKind::Field;
                declaration.location = field.location;
                declaration.sibling_group = field.sibling_group;
                tracker.declare(std::move(declaration));
            }

            // Generated units still read fields declared elsewhere. Reads of
            // exempt fields are well-formed and never reach the tracker.
            for (const auto& occurrence : unit.field_occurrences) {
                if (!exempt.contains(occurrence.symbol)) {
                    tracker.record(occurrence);
                }
            }
        }

    }  // namespace

    const RuleDescriptor& UnusedFieldAnalyzer::rule() const noexcept {
        return UNUSED_FIELD_RULE;
    }

    Result<AnalysisResult, Error> UnusedFieldAnalyzer::analyze(
        const frontend::Program& program,
        const AnalysisOptions& options
    ) const {
        AnalysisResult result;
        const auto& config = options.config;

        if (!config.analyze_fields) {
            return Result<AnalysisResult, Error>::success(std::move(result));
        }

        const auto start_time = std::chrono::steady_clock::now();

        const analysis::FieldExemptionPolicy policy(config);
        analysis::UsageTracker tracker(DeclarationScope::WholeProgram);

        std::unordered_set<SymbolKey> exempt;
        try {
            parallel::ThreadPool pool(static_cast<unsigned int>(config.max_threads));

            const auto summaries = parallel::map(program.units, [&](const frontend::SourceUnit& unit) {
                return screen_unit(unit, policy);
            }, pool);

            for (const auto& summary : summaries) {
                result.declarations_seen += summary.seen;
                result.declarations_exempted += summary.exempted;
                for (const auto& [rule_name, count] : summary.exemptions) {
                    result.exemptions[rule_name] += count;
                }
                exempt.insert(summary.exempt_symbols.begin(), summary.exempt_symbols.end());
            }

            parallel::for_each(program.units, [&](const frontend::SourceUnit& unit) {
                feed_unit(unit, policy, exempt, tracker);
            }, pool);
        } catch (const std::exception& e) {
            return Result<AnalysisResult, Error>::failure(
                Error::analysis_error("Field usage collection failed", e.what()));
        }

        auto unused = tracker.finalize();
        if (unused.is_err()) {
            return Result<AnalysisResult, Error>::failure(unused.error());
        }

        result.diagnostics.reserve(unused.value().size());
        for (const auto& entry : unused.value()) {
            result.diagnostics.push_back(make_diagnostic(UNUSED_FIELD_RULE, entry));
        }
        std::sort(result.diagnostics.begin(), result.diagnostics.end(), diagnostic_order);

        result.stats = tracker.stats();

        const auto end_time = std::chrono::steady_clock::now();
        result.analysis_duration = std::chrono::duration_cast<Duration>(end_time - start_time);

        return Result<AnalysisResult, Error>::success(std::move(result));
    }

    void register_unused_field_analyzer() {
        AnalyzerRegistry::instance().register_analyzer(std::make_unique<UnusedFieldAnalyzer>());
    }

}  // namespace dua::analyzers
