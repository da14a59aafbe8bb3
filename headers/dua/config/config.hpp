//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef DUA_CONFIG_HPP
#define DUA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analysis configuration and its TOML loader.
 *
 * Example file:
 * @code
 *     [analysis]
 *     analyze_fields = true
 *     analyze_parameters = true
 *     skip_generated_code = true
 *     max_threads = 8
 *
 *     [fields]
 *     include_internal = false
 *
 *     [parameters]
 *     exempt_underscore_prefix = true
 *     exempt_attributed = true
 *
 *     [rules]
 *     disabled = ["DUA0002"]
 *     enabled = ["DUA0003"]
 * @endcode
 */

#include "dua/result.hpp"
#include "dua/error.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dua::config
{
    struct FieldPolicyConfig {
        /// Treat `internal` fields as eligible alongside `private` ones
        bool include_internal = false;

        /// Skip fields whose name starts with '_'
        bool exempt_underscore_prefix = false;
    };

    struct ParameterPolicyConfig {
        /// `_`, `_unused`: names starting with '_' are discards
        bool exempt_underscore_prefix = true;

        /// Attributed parameters may be consumed by something we cannot see
        bool exempt_attributed = true;

        bool analyze_lambdas = true;
        bool analyze_local_functions = true;
    };

    struct UsageConfig {
        bool analyze_fields = true;
        bool analyze_parameters = true;

        /// Declarations in generated units are never reported
        bool skip_generated_code = true;

        /// Worker threads for unit/callable processing (0 = auto-detect)
        std::size_t max_threads = 0;

        FieldPolicyConfig fields;
        ParameterPolicyConfig parameters;

        std::vector<std::string> disabled_rules;

        /// Opts into rules that are off by default
        std::vector<std::string> enabled_rules;

        /**
         * A disabled rule never runs. Otherwise an explicitly enabled rule
         * runs, and any other rule falls back to its descriptor default.
         */
        [[nodiscard]] bool is_rule_enabled(std::string_view rule_id, bool enabled_by_default = true) const;

        static UsageConfig defaults() {
            return UsageConfig{};
        }
    };

    /**
     * Parses a TOML document. Unknown keys are ignored; a key holding the
     * wrong type is a ConfigError naming the key.
     */
    [[nodiscard]] Result<UsageConfig, Error> load_from_string(std::string_view content);

    [[nodiscard]] Result<UsageConfig, Error> load_from_file(const std::filesystem::path& path);

}  // namespace dua::config

#endif //DUA_CONFIG_HPP
