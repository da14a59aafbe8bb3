//
// Created by gregorian-rayne on 2/12/26.
//

#include "dua/frontend/program_loader.hpp"
#include "dua/utils/json_utils.hpp"

#include <cstdint>
#include <iterator>
#include <utility>

namespace dua::frontend
{
    using json = nlohmann::json;

    namespace {

        std::optional<CallableKind> callable_kind_from_string(const std::string& name) {
            if (name == "method") return CallableKind::Method;
            if (name == "constructor") return CallableKind::Constructor;
            if (name == "local_function") return CallableKind::LocalFunction;
            if (name == "lambda" || name == "anonymous_function") return CallableKind::Lambda;
            return std::nullopt;
        }

        Result<std::size_t, Error> read_position(const json& object, const std::string& key, const std::string& where) {
            const auto it = object.find(key);
            if (it == object.end() || it->is_null()) {
                return Result<std::size_t, Error>::success(0);
            }
            if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
                return Result<std::size_t, Error>::failure(
                    Error::parse_error("'" + key + "' must be a non-negative integer", where));
            }
            return Result<std::size_t, Error>::success(it->get<std::size_t>());
        }

        Result<SourceLocation, Error> parse_location(
            const json& object,
            const std::string& default_file,
            const std::string& where
        ) {
            SourceLocation location;
            location.file = json_utils::get_or<std::string>(object, "file", default_file);

            auto line = read_position(object, "line", where);
            if (line.is_err()) {
                return Result<SourceLocation, Error>::failure(line.error());
            }
            auto column = read_position(object, "column", where);
            if (column.is_err()) {
                return Result<SourceLocation, Error>::failure(column.error());
            }

            location.line = line.value();
            location.column = column.value();
            return Result<SourceLocation, Error>::success(std::move(location));
        }

        Result<std::string, Error> require_string(
            const json& object,
            const std::string& key,
            const std::string& where
        ) {
            if (auto value = json_utils::get_string(object, key)) {
                return Result<std::string, Error>::success(std::move(*value));
            }
            return Result<std::string, Error>::failure(
                Error::parse_error("Missing or non-string '" + key + "'", where));
        }

        const json& array_or_empty(const json& object, const std::string& key) {
            static const json empty = json::array();
            if (const auto it = object.find(key); it != object.end() && it->is_array()) {
                return *it;
            }
            return empty;
        }

        Result<Occurrence, Error> parse_occurrence(const json& object, const std::string& unit_id) {
            auto symbol = require_string(object, "symbol", unit_id + ": occurrence");
            if (symbol.is_err()) {
                return Result<Occurrence, Error>::failure(symbol.error());
            }

            Occurrence occurrence;
            occurrence.symbol = std::move(symbol).value();
            occurrence.context = context_from_string(
                json_utils::get_or<std::string>(object, "context", "other"));
            auto location = parse_location(object, unit_id, unit_id + ": occurrence " + occurrence.symbol);
            if (location.is_err()) {
                return Result<Occurrence, Error>::failure(location.error());
            }
            occurrence.location = std::move(location).value();
            return Result<Occurrence, Error>::success(std::move(occurrence));
        }

        Result<std::vector<Occurrence>, Error> parse_occurrences(
            const json& object,
            const std::string& key,
            const std::string& unit_id
        ) {
            std::vector<Occurrence> occurrences;
            for (const auto& element : array_or_empty(object, key)) {
                auto occurrence = parse_occurrence(element, unit_id);
                if (occurrence.is_err()) {
                    return Result<std::vector<Occurrence>, Error>::failure(occurrence.error());
                }
                occurrences.push_back(std::move(occurrence).value());
            }
            return Result<std::vector<Occurrence>, Error>::success(std::move(occurrences));
        }

        Result<FieldSite, Error> parse_field(const json& object, const std::string& unit_id) {
            auto symbol = require_string(object, "symbol", unit_id + ": field");
            if (symbol.is_err()) {
                return Result<FieldSite, Error>::failure(symbol.error());
            }
            auto name = require_string(object, "name", unit_id + ": field " + symbol.value());
            if (name.is_err()) {
                return Result<FieldSite, Error>::failure(name.error());
            }

            FieldSite field;
            field.symbol = std::move(symbol).value();
            field.name = std::move(name).value();
            auto location = parse_location(object, unit_id, unit_id + ": field " + field.symbol);
            if (location.is_err()) {
                return Result<FieldSite, Error>::failure(location.error());
            }
            field.location = std::move(location).value();
            field.is_implicit = json_utils::get_or(object, "implicit", false);
            field.is_constant = json_utils::get_or(object, "constant", false);
            field.sibling_group = json_utils::get_string(object, "sibling_group");

            const auto accessibility = json_utils::get_or<std::string>(object, "accessibility", "private");
            if (const auto parsed = accessibility_from_string(accessibility)) {
                field.accessibility = *parsed;
            } else {
                return Result<FieldSite, Error>::failure(
                    Error::parse_error("Unknown accessibility '" + accessibility + "'",
                                       unit_id + ": field " + field.symbol));
            }

            return Result<FieldSite, Error>::success(std::move(field));
        }

        Result<ParameterSite, Error> parse_parameter(const json& object, const std::string& where) {
            auto symbol = require_string(object, "symbol", where + ": parameter");
            if (symbol.is_err()) {
                return Result<ParameterSite, Error>::failure(symbol.error());
            }
            auto name = require_string(object, "name", where + ": parameter " + symbol.value());
            if (name.is_err()) {
                return Result<ParameterSite, Error>::failure(name.error());
            }

            ParameterSite parameter;
            parameter.symbol = std::move(symbol).value();
            parameter.name = std::move(name).value();
            for (const auto& attribute : array_or_empty(object, "attributes")) {
                if (attribute.is_string()) {
                    parameter.attributes.push_back(attribute.get<std::string>());
                }
            }
            return Result<ParameterSite, Error>::success(std::move(parameter));
        }

        Result<CallableSite, Error> parse_callable(const json& object, const std::string& unit_id) {
            auto symbol = require_string(object, "symbol", unit_id + ": callable");
            if (symbol.is_err()) {
                return Result<CallableSite, Error>::failure(symbol.error());
            }

            CallableSite callable;
            callable.symbol = std::move(symbol).value();
            const std::string where = unit_id + ": " + callable.symbol;

            const auto kind_name = json_utils::get_or<std::string>(object, "kind", "method");
            const auto kind = callable_kind_from_string(kind_name);
            if (!kind) {
                return Result<CallableSite, Error>::failure(
                    Error::parse_error("Unknown callable kind '" + kind_name + "'", where));
            }
            callable.kind = *kind;

            // Anonymous functions have no name of their own.
            callable.name = json_utils::get_or<std::string>(
                object, "name", callable.kind == CallableKind::Lambda ? "<lambda>" : "");
            if (callable.name.empty()) {
                return Result<CallableSite, Error>::failure(
                    Error::parse_error("Missing or non-string 'name'", where));
            }

            callable.is_override = json_utils::get_or(object, "override", false);
            callable.implements_interface = json_utils::get_or(object, "interface_impl", false);
            callable.has_body = json_utils::get_or(object, "has_body", true);

            for (const auto& element : array_or_empty(object, "parameters")) {
                auto parameter = parse_parameter(element, where);
                if (parameter.is_err()) {
                    return Result<CallableSite, Error>::failure(parameter.error());
                }
                auto site = std::move(parameter).value();
                auto location = parse_location(element, unit_id, where + ": parameter " + site.symbol);
                if (location.is_err()) {
                    return Result<CallableSite, Error>::failure(location.error());
                }
                site.location = std::move(location).value();
                callable.parameters.push_back(std::move(site));
            }

            auto body = parse_occurrences(object, "occurrences", unit_id);
            if (body.is_err()) {
                return Result<CallableSite, Error>::failure(body.error());
            }
            callable.body_occurrences = std::move(body).value();

            auto initializer = parse_occurrences(object, "initializer_occurrences", unit_id);
            if (initializer.is_err()) {
                return Result<CallableSite, Error>::failure(initializer.error());
            }
            callable.initializer_occurrences = std::move(initializer).value();

            return Result<CallableSite, Error>::success(std::move(callable));
        }

        Result<SourceUnit, Error> parse_unit(const json& object, const std::size_t index) {
            auto id = require_string(object, "id", "unit #" + std::to_string(index));
            if (id.is_err()) {
                return Result<SourceUnit, Error>::failure(id.error());
            }

            SourceUnit unit;
            unit.id = std::move(id).value();
            unit.generated = json_utils::get_or(object, "generated", false);

            for (const auto& element : array_or_empty(object, "fields")) {
                auto field = parse_field(element, unit.id);
                if (field.is_err()) {
                    return Result<SourceUnit, Error>::failure(field.error());
                }
                unit.fields.push_back(std::move(field).value());
            }

            auto occurrences = parse_occurrences(object, "field_occurrences", unit.id);
            if (occurrences.is_err()) {
                return Result<SourceUnit, Error>::failure(occurrences.error());
            }
            unit.field_occurrences = std::move(occurrences).value();

            for (const auto& element : array_or_empty(object, "callables")) {
                auto callable = parse_callable(element, unit.id);
                if (callable.is_err()) {
                    return Result<SourceUnit, Error>::failure(callable.error());
                }
                unit.callables.push_back(std::move(callable).value());
            }

            return Result<SourceUnit, Error>::success(std::move(unit));
        }

        Result<Program, Error> parse_program(const json& document) {
            if (!document.is_object() || !document.contains("units") || !document["units"].is_array()) {
                return Result<Program, Error>::failure(
                    Error::parse_error("Program model must be an object with a 'units' array"));
            }

            Program program;
            try {
                std::size_t index = 0;
                for (const auto& element : document["units"]) {
                    auto unit = parse_unit(element, index++);
                    if (unit.is_err()) {
                        return Result<Program, Error>::failure(unit.error());
                    }
                    program.units.push_back(std::move(unit).value());
                }
            } catch (const json::exception& e) {
                return Result<Program, Error>::failure(
                    Error::parse_error("Malformed program model", e.what()));
            }

            return Result<Program, Error>::success(std::move(program));
        }

    }  // namespace

    const char* to_string(const CallableKind kind) noexcept {
        switch (kind) {
            case CallableKind::Method:        return "method";
            case CallableKind::Constructor:   return "constructor";
            case CallableKind::LocalFunction: return "local_function";
            case CallableKind::Lambda:        return "lambda";
        }
        return "unknown";
    }

    DeclarationKind parameter_kind_of(const CallableKind kind) noexcept {
        switch (kind) {
            case CallableKind::LocalFunction: return DeclarationKind::LocalFunctionParameter;
            case CallableKind::Lambda:        return DeclarationKind::LambdaParameter;
            case CallableKind::Method:
            case CallableKind::Constructor:   return DeclarationKind::Parameter;
        }
        return DeclarationKind::Parameter;
    }

    Result<Program, Error> load_program_from_string(const std::string_view content) {
        return json_utils::parse(content).and_then(parse_program);
    }

    Result<Program, Error> load_program_from_file(const std::filesystem::path& path) {
        auto document = json_utils::read_file(path);
        if (document.is_err()) {
            return Result<Program, Error>::failure(document.error());
        }

        auto program = parse_program(document.value());
        if (program.is_err()) {
            return Result<Program, Error>::failure(program.error().with_context(path.string()));
        }
        return program;
    }

    Program merge_programs(std::vector<Program> programs) {
        Program merged;
        for (auto& program : programs) {
            merged.units.insert(merged.units.end(),
                                std::make_move_iterator(program.units.begin()),
                                std::make_move_iterator(program.units.end()));
        }
        return merged;
    }

}  // namespace dua::frontend
