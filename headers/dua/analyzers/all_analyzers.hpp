//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef DUA_ALL_ANALYZERS_HPP
#define DUA_ALL_ANALYZERS_HPP

/**
 * @file all_analyzers.hpp
 * @brief Includes and registers all available analyzers.
 */

#include "dua/analyzers/unused_field_analyzer.hpp"
#include "dua/analyzers/unused_parameter_analyzer.hpp"

namespace dua::analyzers {

    /**
     * Registers all available analyzers with the global registry.
     * Safe to call more than once.
     */
    inline void register_all_analyzers() {
        register_unused_field_analyzer();
        register_unused_parameter_analyzer();
    }

}  // namespace dua::analyzers

#endif //DUA_ALL_ANALYZERS_HPP
