//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef DUA_TYPES_HPP
#define DUA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for declaration usage analysis.
 *
 * Types are organized into categories:
 *
 * - Basic Types: SourceLocation, DeclarationId, SymbolKey
 * - Declarations: DeclarationKind, DeclarationScope, Accessibility, Declaration
 * - Occurrences: SyntacticContext, AccessRole, Occurrence
 * - Aggregation: UsageRecord
 *
 * A Declaration is created once, at first sight of its binding, and never
 * mutated afterwards. A UsageRecord only ever gains bits (boolean OR), so
 * the order in which occurrences are merged does not matter.
 */

#include <cstddef>
#include <cstdint>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace dua {

    // ============================================================================
    // Basic Types
    // ============================================================================

    /**
     * Source position of a declaration or occurrence.
     *
     * Ordering is (file, line, column), which is the order diagnostics are
     * reported in.
     */
    struct SourceLocation {
        std::string file;
        std::size_t line = 0;
        std::size_t column = 0;

        [[nodiscard]] bool has_location() const noexcept {
            return !file.empty() && line > 0;
        }

        auto operator<=>(const SourceLocation&) const = default;
    };

    /**
     * Stable identity of a tracked binding within one analysis run.
     *
     * Assigned at first sight by the tracker's interner, independent of the
     * declaration's content. Zero is never a valid id.
     */
    using DeclarationId = std::uint32_t;

    inline constexpr DeclarationId INVALID_DECLARATION_ID = 0;

    /**
     * The front-end's resolved binding identity (e.g. a documentation-comment
     * id such as "F:Shop.Cart.items"). Two occurrences that resolve to the
     * same binding carry the same key, whichever source unit they come from.
     */
    using SymbolKey = std::string;

    // ============================================================================
    // Declarations
    // ============================================================================

    enum class DeclarationKind {
        Field,
        Parameter,
        LocalFunctionParameter,
        LambdaParameter
    };

    /**
     * How far the tracker looks for occurrences of a declaration.
     */
    enum class DeclarationScope {
        WholeProgram,   ///< Fields: every unit of the bound program
        SingleBody      ///< Parameters: the enclosing callable's body only
    };

    enum class Accessibility {
        Private,
        PrivateProtected,
        Protected,
        Internal,
        ProtectedInternal,
        Public
    };

    [[nodiscard]] constexpr DeclarationScope scope_of(DeclarationKind kind) noexcept {
        return kind == DeclarationKind::Field
            ? DeclarationScope::WholeProgram
            : DeclarationScope::SingleBody;
    }

    /**
     * A trackable binding site.
     */
    struct Declaration {
        DeclarationId id = INVALID_DECLARATION_ID;
        SymbolKey symbol;
        std::string name;
        DeclarationKind kind = DeclarationKind::Field;
        SourceLocation location;

        /// Co-declared group (e.g. `private int a, b;`). Carried for the edit
        /// layer; the analysis never looks at it.
        std::optional<std::string> sibling_group;

        [[nodiscard]] DeclarationScope scope() const noexcept {
            return scope_of(kind);
        }
    };

    // ============================================================================
    // Occurrences
    // ============================================================================

    /**
     * Immediate syntactic shape around an identifier occurrence.
     *
     * The write shapes are listed first and form a small closed set. Every
     * other value, including Unknown and any value a newer front-end might
     * send, is a read.
     */
    enum class SyntacticContext : std::uint8_t {
        // Write shapes
        AssignmentLeftSimple,       ///< x = ...
        AssignmentLeftCompound,     ///< x += ...
        PrefixIncrement,            ///< ++x
        PrefixDecrement,            ///< --x
        PostfixIncrement,           ///< x++
        PostfixDecrement,           ///< x--
        OutputArgument,             ///< f(out x)

        // Read shapes
        AssignmentRight,            ///< y = x
        MemberAccessReceiver,       ///< x.Member
        ConditionalAccessReceiver,  ///< x?.Member
        ValueArgument,              ///< f(x)
        ReferenceArgument,          ///< f(ref x), f(in x)
        InterpolationOperand,       ///< $"{x}"
        ClosureCapture,             ///< () => x
        QueryPredicate,             ///< where x > 0
        InitializerValue,           ///< new T { P = x }, new[] { x }
        ReturnValue,                ///< return x
        Condition,                  ///< if (x), while (x)
        Other,
        Unknown
    };

    /**
     * Role an occurrence plays for its declaration.
     */
    enum class AccessRole {
        Read,
        WriteOnly,
        ReadWrite
    };

    /**
     * One syntactic appearance of an identifier resolved to a binding.
     *
     * The role is not stored; it is derived by classify() when the
     * occurrence is recorded.
     */
    struct Occurrence {
        SymbolKey symbol;
        SyntacticContext context = SyntacticContext::Other;
        SourceLocation location;
    };

    // ============================================================================
    // Aggregation
    // ============================================================================

    /**
     * Aggregated access history of one declaration.
     *
     * A ReadWrite occurrence (x += 1, x++) marks a write only: the value it
     * reads is consumed by the same declaration, so on its own it does not
     * make the declaration used.
     */
    struct UsageRecord {
        bool has_read = false;
        bool has_write = false;

        void merge(AccessRole role) noexcept {
            switch (role) {
                case AccessRole::Read:
                    has_read = true;
                    break;
                case AccessRole::WriteOnly:
                case AccessRole::ReadWrite:
                    has_write = true;
                    break;
            }
        }

        void merge(const UsageRecord& other) noexcept {
            has_read = has_read || other.has_read;
            has_write = has_write || other.has_write;
        }

        [[nodiscard]] bool is_unused() const noexcept {
            return !has_read;
        }

        bool operator==(const UsageRecord&) const = default;
    };

    // ============================================================================
    // String conversions
    // ============================================================================

    [[nodiscard]] const char* to_string(DeclarationKind kind) noexcept;
    [[nodiscard]] const char* to_string(Accessibility accessibility) noexcept;
    [[nodiscard]] const char* to_string(SyntacticContext context) noexcept;
    [[nodiscard]] const char* to_string(AccessRole role) noexcept;

    /**
     * Parses the snake_case name of a context. Unrecognized names map to
     * SyntacticContext::Unknown rather than failing.
     */
    [[nodiscard]] SyntacticContext context_from_string(std::string_view name) noexcept;

    [[nodiscard]] std::optional<Accessibility> accessibility_from_string(std::string_view name) noexcept;

    [[nodiscard]] std::string format_location(const SourceLocation& location);

}  // namespace dua

#endif //DUA_TYPES_HPP
