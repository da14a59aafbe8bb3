//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef DUA_UNUSED_FIELD_ANALYZER_HPP
#define DUA_UNUSED_FIELD_ANALYZER_HPP

/**
 * @file unused_field_analyzer.hpp
 * @brief Private fields that are never read (DUA0001).
 *
 * A private field may be read from any unit of the program (partial
 * types), so all units feed one whole-program tracker. Units are processed
 * concurrently, each under a ProducerScope, and the tracker is finalized
 * once every unit has been consumed.
 */

#include "dua/analyzers/analyzer.hpp"

namespace dua::analyzers {

    class UnusedFieldAnalyzer : public IAnalyzer {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "UnusedFieldAnalyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Reports private fields whose value is never read";
        }

        [[nodiscard]] const RuleDescriptor& rule() const noexcept override;

        [[nodiscard]] Result<AnalysisResult, Error> analyze(
            const frontend::Program& program,
            const AnalysisOptions& options
        ) const override;
    };

    void register_unused_field_analyzer();

}  // namespace dua::analyzers

#endif //DUA_UNUSED_FIELD_ANALYZER_HPP
