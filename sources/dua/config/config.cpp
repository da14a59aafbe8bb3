//
// Created by gregorian-rayne on 2/11/26.
//

#include "dua/config/config.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

namespace dua::config
{
    namespace {

        std::optional<Error> read_bool(
            const toml::node_view<const toml::node> section,
            const std::string_view section_name,
            const std::string_view key,
            bool& target
        ) {
            const auto node = section[key];
            if (!node) {
                return std::nullopt;
            }
            if (!node.is_boolean()) {
                return Error::config_error("Expected a boolean",
                                           std::string(section_name) + "." + std::string(key));
            }
            target = node.value_or(target);
            return std::nullopt;
        }

        std::optional<Error> read_count(
            const toml::node_view<const toml::node> section,
            const std::string_view section_name,
            const std::string_view key,
            std::size_t& target
        ) {
            const auto node = section[key];
            if (!node) {
                return std::nullopt;
            }
            const auto value = node.value<std::int64_t>();
            if (!node.is_integer() || !value || *value < 0) {
                return Error::config_error("Expected a non-negative integer",
                                           std::string(section_name) + "." + std::string(key));
            }
            target = static_cast<std::size_t>(*value);
            return std::nullopt;
        }

        std::optional<Error> read_string_list(
            const toml::node_view<const toml::node> section,
            const std::string_view section_name,
            const std::string_view key,
            std::vector<std::string>& target
        ) {
            const auto node = section[key];
            if (!node) {
                return std::nullopt;
            }
            const auto* array = node.as_array();
            if (array == nullptr) {
                return Error::config_error("Expected an array of strings",
                                           std::string(section_name) + "." + std::string(key));
            }
            target.clear();
            for (const auto& element : *array) {
                const auto value = element.value<std::string>();
                if (!value) {
                    return Error::config_error("Expected an array of strings",
                                               std::string(section_name) + "." + std::string(key));
                }
                target.push_back(*value);
            }
            return std::nullopt;
        }

    }  // namespace

    bool UsageConfig::is_rule_enabled(const std::string_view rule_id, const bool enabled_by_default) const {
        if (std::find(disabled_rules.begin(), disabled_rules.end(), rule_id) != disabled_rules.end()) {
            return false;
        }
        if (std::find(enabled_rules.begin(), enabled_rules.end(), rule_id) != enabled_rules.end()) {
            return true;
        }
        return enabled_by_default;
    }

    Result<UsageConfig, Error> load_from_string(const std::string_view content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<UsageConfig, Error>::failure(
                Error::config_error("Failed to parse TOML configuration", std::string(err.description())));
        }

        UsageConfig config = UsageConfig::defaults();
        const toml::node_view<const toml::node> root{tbl};

        const auto analysis = root["analysis"];
        const auto fields = root["fields"];
        const auto parameters = root["parameters"];
        const auto rules = root["rules"];

        const std::optional<Error> errors[] = {
            read_bool(analysis, "analysis", "analyze_fields", config.analyze_fields),
            read_bool(analysis, "analysis", "analyze_parameters", config.analyze_parameters),
            read_bool(analysis, "analysis", "skip_generated_code", config.skip_generated_code),
            read_count(analysis, "analysis", "max_threads", config.max_threads),

            read_bool(fields, "fields", "include_internal", config.fields.include_internal),
            read_bool(fields, "fields", "exempt_underscore_prefix", config.fields.exempt_underscore_prefix),

            read_bool(parameters, "parameters", "exempt_underscore_prefix", config.parameters.exempt_underscore_prefix),
            read_bool(parameters, "parameters", "exempt_attributed", config.parameters.exempt_attributed),
            read_bool(parameters, "parameters", "analyze_lambdas", config.parameters.analyze_lambdas),
            read_bool(parameters, "parameters", "analyze_local_functions", config.parameters.analyze_local_functions),

            read_string_list(rules, "rules", "disabled", config.disabled_rules),
            read_string_list(rules, "rules", "enabled", config.enabled_rules),
        };

        for (const auto& error : errors) {
            if (error) {
                return Result<UsageConfig, Error>::failure(*error);
            }
        }

        return Result<UsageConfig, Error>::success(std::move(config));
    }

    Result<UsageConfig, Error> load_from_file(const std::filesystem::path& path) {
        if (std::error_code ec; !std::filesystem::exists(path, ec)) {
            return Result<UsageConfig, Error>::failure(
                Error::not_found("Configuration file not found", path.string()));
        }

        std::ifstream file(path);
        if (!file) {
            return Result<UsageConfig, Error>::failure(
                Error::io_error("Failed to open configuration file", path.string()));
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto result = load_from_string(buffer.str());
        if (result.is_err()) {
            return Result<UsageConfig, Error>::failure(result.error().with_context(path.string()));
        }
        return result;
    }

}  // namespace dua::config
