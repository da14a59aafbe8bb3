//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef DUA_EXEMPTION_POLICY_HPP
#define DUA_EXEMPTION_POLICY_HPP

/**
 * @file exemption_policy.hpp
 * @brief Decides whether a declaration is eligible for usage tracking.
 *
 * A policy is an ordered chain of named rules evaluated before a
 * declaration reaches the tracker, cheapest first. The first rule that
 * exempts the candidate wins. Policies only look at declaration metadata,
 * never at occurrences.
 *
 * Two policies exist, selected once per declaration kind:
 * - FieldExemptionPolicy: non-private, compiler-synthesized and constant
 *   fields are exempt.
 * - ParameterExemptionPolicy: parameters of overrides, interface
 *   implementations and bodiless callables are exempt, as are discarded
 *   names and attributed parameters.
 */

#include "dua/types.hpp"
#include "dua/config/config.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dua::analysis {

    /**
     * Metadata a policy needs about a declaration site.
     *
     * The owner_* members describe the enclosing callable and are only
     * meaningful for parameters.
     */
    struct DeclarationCandidate {
        std::string name;
        DeclarationKind kind = DeclarationKind::Field;
        Accessibility accessibility = Accessibility::Private;

        bool is_implicit = false;        ///< Compiler-synthesized (e.g. property backing storage)
        bool is_constant = false;        ///< Compile-time constant
        bool in_generated_code = false;

        bool owner_is_override = false;
        bool owner_implements_interface = false;
        bool owner_has_body = true;

        std::size_t attribute_count = 0;
    };

    /**
     * One link of a policy chain.
     */
    struct ExemptionRule {
        std::string_view name;
        std::function<bool(const DeclarationCandidate&)> exempts;
    };

    /**
     * True for names made only of underscores (`_`, `__`): discards in
     * every configuration.
     */
    [[nodiscard]] bool is_discard_name(std::string_view name) noexcept;

    /**
     * Base interface for exemption policies.
     */
    class IExemptionPolicy {
    public:
        virtual ~IExemptionPolicy() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns the name of the first rule exempting the candidate, or
         * nullopt when the candidate should be tracked.
         */
        [[nodiscard]] std::optional<std::string_view> exemption_reason(
            const DeclarationCandidate& candidate
        ) const;

        [[nodiscard]] bool should_track(const DeclarationCandidate& candidate) const {
            return !exemption_reason(candidate).has_value();
        }

        [[nodiscard]] std::size_t rule_count() const noexcept {
            return rules_.size();
        }

    protected:
        void add_rule(std::string_view name, std::function<bool(const DeclarationCandidate&)> exempts);

    private:
        std::vector<ExemptionRule> rules_;
    };

    class FieldExemptionPolicy : public IExemptionPolicy {
    public:
        explicit FieldExemptionPolicy(const config::UsageConfig& config = config::UsageConfig::defaults());

        [[nodiscard]] std::string_view name() const noexcept override {
            return "FieldExemptionPolicy";
        }
    };

    class ParameterExemptionPolicy : public IExemptionPolicy {
    public:
        explicit ParameterExemptionPolicy(const config::UsageConfig& config = config::UsageConfig::defaults());

        [[nodiscard]] std::string_view name() const noexcept override {
            return "ParameterExemptionPolicy";
        }
    };

    /**
     * Selects the policy for a declaration kind.
     */
    [[nodiscard]] std::unique_ptr<IExemptionPolicy> make_policy(
        DeclarationKind kind,
        const config::UsageConfig& config
    );

}  // namespace dua::analysis

#endif //DUA_EXEMPTION_POLICY_HPP
