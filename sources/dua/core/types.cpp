//
// Created by gregorian-rayne on 2/9/26.
//

#include "dua/types.hpp"

#include <array>
#include <utility>

namespace dua
{
    namespace {

        constexpr std::array<std::pair<std::string_view, SyntacticContext>, 20> CONTEXT_NAMES = {{
            {"assignment_left_simple", SyntacticContext::AssignmentLeftSimple},
            {"assignment_left_compound", SyntacticContext::AssignmentLeftCompound},
            {"prefix_increment", SyntacticContext::PrefixIncrement},
            {"prefix_decrement", SyntacticContext::PrefixDecrement},
            {"postfix_increment", SyntacticContext::PostfixIncrement},
            {"postfix_decrement", SyntacticContext::PostfixDecrement},
            {"output_argument", SyntacticContext::OutputArgument},
            {"assignment_right", SyntacticContext::AssignmentRight},
            {"member_access_receiver", SyntacticContext::MemberAccessReceiver},
            {"conditional_access_receiver", SyntacticContext::ConditionalAccessReceiver},
            {"value_argument", SyntacticContext::ValueArgument},
            {"reference_argument", SyntacticContext::ReferenceArgument},
            {"interpolation_operand", SyntacticContext::InterpolationOperand},
            {"closure_capture", SyntacticContext::ClosureCapture},
            {"query_predicate", SyntacticContext::QueryPredicate},
            {"initializer_value", SyntacticContext::InitializerValue},
            {"return_value", SyntacticContext::ReturnValue},
            {"condition", SyntacticContext::Condition},
            {"other", SyntacticContext::Other},
            {"unknown", SyntacticContext::Unknown},
        }};

    }  // namespace

    const char* to_string(const DeclarationKind kind) noexcept {
        switch (kind) {
            case DeclarationKind::Field:                  return "field";
            case DeclarationKind::Parameter:              return "parameter";
            case DeclarationKind::LocalFunctionParameter: return "local_function_parameter";
            case DeclarationKind::LambdaParameter:        return "lambda_parameter";
        }
        return "unknown";
    }

    const char* to_string(const Accessibility accessibility) noexcept {
        switch (accessibility) {
            case Accessibility::Private:           return "private";
            case Accessibility::PrivateProtected:  return "private_protected";
            case Accessibility::Protected:         return "protected";
            case Accessibility::Internal:          return "internal";
            case Accessibility::ProtectedInternal: return "protected_internal";
            case Accessibility::Public:            return "public";
        }
        return "unknown";
    }

    const char* to_string(const SyntacticContext context) noexcept {
        for (const auto& [name, value] : CONTEXT_NAMES) {
            if (value == context) {
                return name.data();
            }
        }
        return "unknown";
    }

    const char* to_string(const AccessRole role) noexcept {
        switch (role) {
            case AccessRole::Read:      return "read";
            case AccessRole::WriteOnly: return "write_only";
            case AccessRole::ReadWrite: return "read_write";
        }
        return "unknown";
    }

    SyntacticContext context_from_string(const std::string_view name) noexcept {
        for (const auto& [context_name, value] : CONTEXT_NAMES) {
            if (context_name == name) {
                return value;
            }
        }
        return SyntacticContext::Unknown;
    }

    std::optional<Accessibility> accessibility_from_string(const std::string_view name) noexcept {
        if (name == "private") return Accessibility::Private;
        if (name == "private_protected" || name == "private protected") return Accessibility::PrivateProtected;
        if (name == "protected") return Accessibility::Protected;
        if (name == "internal") return Accessibility::Internal;
        if (name == "protected_internal" || name == "protected internal") return Accessibility::ProtectedInternal;
        if (name == "public") return Accessibility::Public;
        return std::nullopt;
    }

    std::string format_location(const SourceLocation& location) {
        if (location.file.empty()) {
            return "<unknown>";
        }
        std::string result = location.file;
        if (location.line > 0) {
            result += ":" + std::to_string(location.line);
            if (location.column > 0) {
                result += ":" + std::to_string(location.column);
            }
        }
        return result;
    }

}  // namespace dua
