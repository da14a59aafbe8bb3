//
// Created by gregorian-rayne on 2/10/26.
//

#include "dua/analysis/exemption_policy.hpp"

#include <algorithm>

namespace dua::analysis
{
    namespace {

        bool is_parameter_kind(const DeclarationKind kind) {
            return kind == DeclarationKind::Parameter ||
                   kind == DeclarationKind::LocalFunctionParameter ||
                   kind == DeclarationKind::LambdaParameter;
        }

        bool has_underscore_prefix(const std::string_view name) {
            return !name.empty() && name.front() == '_';
        }

    }  // namespace

    bool is_discard_name(const std::string_view name) noexcept {
        return !name.empty() &&
               std::ranges::all_of(name, [](const char c) { return c == '_'; });
    }

    std::optional<std::string_view> IExemptionPolicy::exemption_reason(
        const DeclarationCandidate& candidate
    ) const {
        for (const auto& rule : rules_) {
            if (rule.exempts(candidate)) {
                return rule.name;
            }
        }
        return std::nullopt;
    }

    void IExemptionPolicy::add_rule(
        const std::string_view name,
        std::function<bool(const DeclarationCandidate&)> exempts
    ) {
        rules_.push_back({name, std::move(exempts)});
    }

    // ============================================================================
    // Field policy
    // ============================================================================

    FieldExemptionPolicy::FieldExemptionPolicy(const config::UsageConfig& config) {
        const bool skip_generated = config.skip_generated_code;
        const bool include_internal = config.fields.include_internal;

        add_rule("not_a_field", [](const DeclarationCandidate& c) {
            return c.kind != DeclarationKind::Field;
        });

        add_rule("unnamed", [](const DeclarationCandidate& c) {
            return c.name.empty();
        });

        if (skip_generated) {
            add_rule("generated_code", [](const DeclarationCandidate& c) {
                return c.in_generated_code;
            });
        }

        add_rule("not_private", [include_internal](const DeclarationCandidate& c) {
            if (c.accessibility == Accessibility::Private) {
                return false;
            }
            return !(include_internal && c.accessibility == Accessibility::Internal);
        });

        add_rule("compiler_synthesized", [](const DeclarationCandidate& c) {
            return c.is_implicit;
        });

        add_rule("constant", [](const DeclarationCandidate& c) {
            return c.is_constant;
        });

        if (config.fields.exempt_underscore_prefix) {
            add_rule("underscore_prefix", [](const DeclarationCandidate& c) {
                return has_underscore_prefix(c.name);
            });
        }
    }

    // ============================================================================
    // Parameter policy
    // ============================================================================

    ParameterExemptionPolicy::ParameterExemptionPolicy(const config::UsageConfig& config) {
        const auto& params = config.parameters;

        add_rule("not_a_parameter", [](const DeclarationCandidate& c) {
            return !is_parameter_kind(c.kind);
        });

        add_rule("unnamed", [](const DeclarationCandidate& c) {
            return c.name.empty();
        });

        if (config.skip_generated_code) {
            add_rule("generated_code", [](const DeclarationCandidate& c) {
                return c.in_generated_code;
            });
        }

        if (!params.analyze_lambdas) {
            add_rule("lambda_analysis_disabled", [](const DeclarationCandidate& c) {
                return c.kind == DeclarationKind::LambdaParameter;
            });
        }

        if (!params.analyze_local_functions) {
            add_rule("local_function_analysis_disabled", [](const DeclarationCandidate& c) {
                return c.kind == DeclarationKind::LocalFunctionParameter;
            });
        }

        add_rule("overrides_member", [](const DeclarationCandidate& c) {
            return c.owner_is_override;
        });

        add_rule("implements_interface", [](const DeclarationCandidate& c) {
            return c.owner_implements_interface;
        });

        add_rule("no_body", [](const DeclarationCandidate& c) {
            return !c.owner_has_body;
        });

        add_rule("discarded_name", [](const DeclarationCandidate& c) {
            return is_discard_name(c.name);
        });

        if (params.exempt_underscore_prefix) {
            add_rule("underscore_prefix", [](const DeclarationCandidate& c) {
                return has_underscore_prefix(c.name);
            });
        }

        if (params.exempt_attributed) {
            add_rule("attributed", [](const DeclarationCandidate& c) {
                return c.attribute_count > 0;
            });
        }
    }

    std::unique_ptr<IExemptionPolicy> make_policy(
        const DeclarationKind kind,
        const config::UsageConfig& config
    ) {
        if (kind == DeclarationKind::Field) {
            return std::make_unique<FieldExemptionPolicy>(config);
        }
        return std::make_unique<ParameterExemptionPolicy>(config);
    }

}  // namespace dua::analysis
