//
// Created by gregorian-rayne on 2/10/26.
//

#include "dua/analysis/access_classifier.hpp"

namespace dua::analysis
{
    AccessRole classify(const SyntacticContext context) noexcept {
        switch (context) {
            case SyntacticContext::AssignmentRight:
                return AccessRole::Read;

            case SyntacticContext::AssignmentLeftSimple:
                return AccessRole::WriteOnly;

            case SyntacticContext::AssignmentLeftCompound:
                return AccessRole::ReadWrite;

            case SyntacticContext::PrefixIncrement:
            case SyntacticContext::PrefixDecrement:
            case SyntacticContext::PostfixIncrement:
            case SyntacticContext::PostfixDecrement:
                return AccessRole::ReadWrite;

            case SyntacticContext::OutputArgument:
                return AccessRole::WriteOnly;

            // Receivers, by-value and by-reference arguments, interpolation,
            // closure captures, query predicates and initializer values.
            case SyntacticContext::MemberAccessReceiver:
            case SyntacticContext::ConditionalAccessReceiver:
            case SyntacticContext::ValueArgument:
            case SyntacticContext::ReferenceArgument:
            case SyntacticContext::InterpolationOperand:
            case SyntacticContext::ClosureCapture:
            case SyntacticContext::QueryPredicate:
            case SyntacticContext::InitializerValue:
            case SyntacticContext::ReturnValue:
            case SyntacticContext::Condition:
            case SyntacticContext::Other:
            case SyntacticContext::Unknown:
                return AccessRole::Read;
        }
        // Values outside the enumerators (a newer front-end) are reads too.
        return AccessRole::Read;
    }

    bool is_write_shape(const SyntacticContext context) noexcept {
        return classify(context) != AccessRole::Read;
    }

}  // namespace dua::analysis
