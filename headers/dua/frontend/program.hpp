//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef DUA_PROGRAM_HPP
#define DUA_PROGRAM_HPP

/**
 * @file program.hpp
 * @brief The bound program as delivered by the front-end.
 *
 * Parsing and symbol resolution happen outside this project. The front-end
 * hands over, per source unit, the declaration sites and the resolved
 * identifier occurrences with their immediate syntactic context.
 *
 * Callables are flat within a unit: a lambda nested in a method is its own
 * CallableSite whose occurrences are not repeated in the method's list.
 * When the lambda reads one of the method's parameters, the method's list
 * carries that parameter with SyntacticContext::ClosureCapture.
 */

#include "dua/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dua::frontend {

    struct FieldSite {
        SymbolKey symbol;
        std::string name;
        SourceLocation location;
        Accessibility accessibility = Accessibility::Private;
        bool is_implicit = false;
        bool is_constant = false;
        std::optional<std::string> sibling_group;
    };

    enum class CallableKind {
        Method,
        Constructor,
        LocalFunction,
        Lambda
    };

    struct ParameterSite {
        SymbolKey symbol;
        std::string name;
        SourceLocation location;
        std::vector<std::string> attributes;
    };

    struct CallableSite {
        SymbolKey symbol;
        std::string name;
        CallableKind kind = CallableKind::Method;

        bool is_override = false;
        bool implements_interface = false;
        bool has_body = true;   ///< false for abstract, extern and partial definitions

        std::vector<ParameterSite> parameters;
        std::vector<Occurrence> body_occurrences;

        /// Constructor initializer (`: base(x)`), folded into the body's read-set
        std::vector<Occurrence> initializer_occurrences;
    };

    struct SourceUnit {
        std::string id;
        bool generated = false;

        std::vector<FieldSite> fields;
        std::vector<Occurrence> field_occurrences;
        std::vector<CallableSite> callables;
    };

    struct Program {
        std::vector<SourceUnit> units;

        [[nodiscard]] std::size_t callable_count() const noexcept {
            std::size_t count = 0;
            for (const auto& unit : units) {
                count += unit.callables.size();
            }
            return count;
        }
    };

    [[nodiscard]] const char* to_string(CallableKind kind) noexcept;

    /**
     * Parameter declaration kind for a callable kind.
     */
    [[nodiscard]] DeclarationKind parameter_kind_of(CallableKind kind) noexcept;

}  // namespace dua::frontend

#endif //DUA_PROGRAM_HPP
