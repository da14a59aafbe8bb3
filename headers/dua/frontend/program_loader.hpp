//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef DUA_PROGRAM_LOADER_HPP
#define DUA_PROGRAM_LOADER_HPP

/**
 * @file program_loader.hpp
 * @brief Reads a front-end program model from JSON.
 *
 * Document layout:
 * @code
 *     {
 *       "units": [{
 *         "id": "Cart.cs",
 *         "generated": false,
 *         "fields": [{"symbol": "F:Cart.items", "name": "items", "line": 4, "column": 17,
 *                     "accessibility": "private", "implicit": false, "constant": false,
 *                     "sibling_group": "Cart.cs:4"}],
 *         "field_occurrences": [{"symbol": "F:Cart.items", "context": "member_access_receiver",
 *                                "line": 9, "column": 13}],
 *         "callables": [{"symbol": "M:Cart.Add(Item)", "name": "Add", "kind": "method",
 *                        "override": false, "interface_impl": false, "has_body": true,
 *                        "parameters": [{"symbol": "P:Cart.Add(Item).item", "name": "item",
 *                                        "line": 8, "column": 25, "attributes": []}],
 *                        "occurrences": [{"symbol": "P:Cart.Add(Item).item",
 *                                         "context": "value_argument"}],
 *                        "initializer_occurrences": []}]
 *       }]
 *     }
 * @endcode
 *
 * Locations default to the unit id for their file. Unknown context names
 * load as SyntacticContext::Unknown.
 */

#include "dua/frontend/program.hpp"
#include "dua/result.hpp"
#include "dua/error.hpp"

#include <filesystem>
#include <string_view>

namespace dua::frontend {

    [[nodiscard]] Result<Program, Error> load_program_from_string(std::string_view content);

    [[nodiscard]] Result<Program, Error> load_program_from_file(const std::filesystem::path& path);

    /**
     * Concatenates the units of several programs into one bound program.
     */
    [[nodiscard]] Program merge_programs(std::vector<Program> programs);

}  // namespace dua::frontend

#endif //DUA_PROGRAM_LOADER_HPP
