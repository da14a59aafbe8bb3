//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef DUA_ACCESS_CLASSIFIER_HPP
#define DUA_ACCESS_CLASSIFIER_HPP

/**
 * @file access_classifier.hpp
 * @brief Maps the syntactic shape around an occurrence to an access role.
 *
 * Rules, first match wins:
 * 1. Right operand of a simple assignment          -> Read
 * 2. Left operand of a simple assignment           -> WriteOnly
 * 3. Left operand of a compound assignment         -> ReadWrite
 * 4. Operand of ++ / -- (prefix or postfix)        -> ReadWrite
 * 5. Argument bound to an output-only parameter    -> WriteOnly
 * 6. Anything else                                 -> Read
 *
 * The default is Read: the write shapes are a small closed set, while new
 * language constructs keep adding read shapes. An unrecognized shape can
 * therefore only hide a dead write, never report a live declaration.
 */

#include "dua/types.hpp"

namespace dua::analysis {

    /**
     * Classifies an occurrence context. Total and pure.
     */
    [[nodiscard]] AccessRole classify(SyntacticContext context) noexcept;

    /**
     * True for the contexts that can never make a declaration used.
     */
    [[nodiscard]] bool is_write_shape(SyntacticContext context) noexcept;

}  // namespace dua::analysis

#endif //DUA_ACCESS_CLASSIFIER_HPP
