//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef DUA_UNUSED_PARAMETER_ANALYZER_HPP
#define DUA_UNUSED_PARAMETER_ANALYZER_HPP

/**
 * @file unused_parameter_analyzer.hpp
 * @brief Parameters that are never read in their callable's body (DUA0002).
 *
 * A parameter is only visible inside its own callable, so each callable
 * gets a private single-body tracker. Constructor initializer occurrences
 * are folded into the constructor's tracker. Lambdas and local functions
 * are callables of their own and report their own parameters.
 */

#include "dua/analyzers/analyzer.hpp"

namespace dua::analyzers {

    class UnusedParameterAnalyzer : public IAnalyzer {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "UnusedParameterAnalyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Reports parameters whose value is never read in the body";
        }

        [[nodiscard]] const RuleDescriptor& rule() const noexcept override;

        [[nodiscard]] Result<AnalysisResult, Error> analyze(
            const frontend::Program& program,
            const AnalysisOptions& options
        ) const override;
    };

    void register_unused_parameter_analyzer();

}  // namespace dua::analyzers

#endif //DUA_UNUSED_PARAMETER_ANALYZER_HPP
