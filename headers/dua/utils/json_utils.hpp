//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef DUA_JSON_UTILS_HPP
#define DUA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers returning Result<T, Error>.
 */

#include "dua/result.hpp"
#include "dua/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace dua::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        try {
            json data;
            file >> data;
            return Result<json, Error>::success(std::move(data));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", path.string() + ": " + e.what())
            );
        }
    }

    /**
     * Writes a JSON document, creating parent directories as needed.
     *
     * @param indent Indentation (-1 for compact output).
     */
    inline Result<void, Error> write_file(const fs::path& path, const json& data, int indent = 2) {
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        try {
            file << data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }
        return Result<void, Error>::success();
    }

    /**
     * Reads an optional member, falling back when absent or null.
     */
    template<typename T>
    T get_or(const json& object, const std::string& key, T fallback) {
        if (const auto it = object.find(key); it != object.end() && !it->is_null()) {
            return it->template get<T>();
        }
        return fallback;
    }

    inline std::optional<std::string> get_string(const json& object, const std::string& key) {
        if (const auto it = object.find(key); it != object.end() && it->is_string()) {
            return it->template get<std::string>();
        }
        return std::nullopt;
    }

}  // namespace dua::json_utils

#endif //DUA_JSON_UTILS_HPP
