//
// Created by gregorian-rayne on 2/13/26.
//

#include "dua/analyzers/unused_parameter_analyzer.hpp"
#include "dua/analysis/exemption_policy.hpp"
#include "dua/analysis/usage_tracker.hpp"
#include "dua/utils/parallel.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <string>

namespace dua::analyzers
{
    namespace {

        constexpr RuleDescriptor UNUSED_PARAMETER_RULE{
            .id = "DUA0002",
            .title = "Unused parameter",
            .message_format = "Parameter '{0}' is never read",
            .write_only_message_format = "Parameter '{0}' is assigned but its value is never read",
            .category = "Usage",
            .severity = Severity::Warning,
            .enabled_by_default = true,
            .description = "A parameter whose value is never read in the body of its callable. "
                           "Overrides, interface implementations and bodiless callables are exempt."
        };

        struct CallableRef {
            const frontend::SourceUnit* unit;
            const frontend::CallableSite* callable;
        };

        struct CallableSummary {
            std::size_t seen = 0;
            std::size_t exempted = 0;
            std::map<std::string, std::size_t> exemptions;
            std::vector<Diagnostic> diagnostics;
            analysis::TrackerStats stats;
            std::optional<Error> error;
        };

        analysis::DeclarationCandidate make_candidate(
            const frontend::ParameterSite& parameter,
            const frontend::CallableSite& callable,
            const frontend::SourceUnit& unit
        ) {
            analysis::DeclarationCandidate candidate;
            candidate.name = parameter.name;
            candidate.kind = frontend::parameter_kind_of(callable.kind);
            candidate.in_generated_code = unit.generated;
            candidate.owner_is_override = callable.is_override;
            candidate.owner_implements_interface = callable.implements_interface;
            candidate.owner_has_body = callable.has_body;
            candidate.attribute_count = parameter.attributes.size();
            return candidate;
        }

        void record_declared(analysis::UsageTracker& tracker, const std::vector<Occurrence>& occurrences) {
            for (const auto& occurrence : occurrences) {
                // Locals, fields and exempt parameters share the body's stream.
                if (tracker.lookup(occurrence.symbol)) {
                    tracker.record(occurrence);
                }
            }
        }

        CallableSummary analyze_callable(const CallableRef& ref, const analysis::IExemptionPolicy& policy) {
            const auto& callable = *ref.callable;
            CallableSummary summary;

            analysis::UsageTracker tracker(DeclarationScope::SingleBody);
            std::size_t tracked = 0;

            for (const auto& parameter : callable.parameters) {
                ++summary.seen;
                if (const auto reason = policy.exemption_reason(make_candidate(parameter, callable, *ref.unit))) {
                    ++summary.exempted;
                    ++summary.exemptions[std::string(*reason)];
                    continue;
                }

                Declaration declaration;
                declaration.symbol = parameter.symbol;
                declaration.name = parameter.name;
                declaration.kind = frontend::parameter_kind_of(callable.kind);
                declaration.location = parameter.location;
                if (tracker.declare(std::move(declaration)) != INVALID_DECLARATION_ID) {
                    ++tracked;
                }
            }

            if (tracked == 0) {
                return summary;
            }

            record_declared(tracker, callable.body_occurrences);
            record_declared(tracker, callable.initializer_occurrences);

            auto unused = tracker.finalize();
            if (unused.is_err()) {
                summary.error = unused.error().with_context(callable.symbol);
                return summary;
            }

            for (const auto& entry : unused.value()) {
                summary.diagnostics.push_back(make_diagnostic(UNUSED_PARAMETER_RULE, entry));
            }
            summary.stats = tracker.stats();
            return summary;
        }

    }  // namespace

    const RuleDescriptor& UnusedParameterAnalyzer::rule() const noexcept {
        return UNUSED_PARAMETER_RULE;
    }

    Result<AnalysisResult, Error> UnusedParameterAnalyzer::analyze(
        const frontend::Program& program,
        const AnalysisOptions& options
    ) const {
        AnalysisResult result;
        const auto& config = options.config;

        if (!config.analyze_parameters) {
            return Result<AnalysisResult, Error>::success(std::move(result));
        }

        const auto start_time = std::chrono::steady_clock::now();

        const analysis::ParameterExemptionPolicy policy(config);

        std::vector<CallableRef> callables;
        callables.reserve(program.callable_count());
        for (const auto& unit : program.units) {
            for (const auto& callable : unit.callables) {
                callables.push_back({&unit, &callable});
            }
        }

        std::vector<CallableSummary> summaries;
        try {
            parallel::ThreadPool pool(static_cast<unsigned int>(config.max_threads));
            summaries = parallel::map(callables, [&](const CallableRef& ref) {
                return analyze_callable(ref, policy);
            }, pool);
        } catch (const std::exception& e) {
            return Result<AnalysisResult, Error>::failure(
                Error::analysis_error("Parameter usage collection failed", e.what()));
        }

        for (auto& summary : summaries) {
            if (summary.error) {
                return Result<AnalysisResult, Error>::failure(*summary.error);
            }

            result.declarations_seen += summary.seen;
            result.declarations_exempted += summary.exempted;
            for (const auto& [rule_name, count] : summary.exemptions) {
                result.exemptions[rule_name] += count;
            }
            result.stats.merge(summary.stats);
            result.diagnostics.insert(result.diagnostics.end(),
                                      std::make_move_iterator(summary.diagnostics.begin()),
                                      std::make_move_iterator(summary.diagnostics.end()));
        }
        std::sort(result.diagnostics.begin(), result.diagnostics.end(), diagnostic_order);

        const auto end_time = std::chrono::steady_clock::now();
        result.analysis_duration = std::chrono::duration_cast<Duration>(end_time - start_time);

        return Result<AnalysisResult, Error>::success(std::move(result));
    }

    void register_unused_parameter_analyzer() {
        AnalyzerRegistry::instance().register_analyzer(std::make_unique<UnusedParameterAnalyzer>());
    }

}  // namespace dua::analyzers
