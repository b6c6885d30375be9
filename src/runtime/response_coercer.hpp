#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/chat_contract.hpp"

namespace agentloop::runtime {

// JSON Schema for an answer type. Specialize for your own structs and give
// them an nlohmann from_json:
//
//   template <> struct JsonSchemaOf<Answer> {
//       static nlohmann::json schema() { return {{"type", "object"}, ...}; }
//   };
template <typename T, typename Enable = void>
struct JsonSchemaOf;

template <typename T>
struct JsonSchemaOf<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static nlohmann::json schema() { return {{"type", "integer"}}; }
};

template <typename T>
struct JsonSchemaOf<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static nlohmann::json schema() { return {{"type", "number"}}; }
};

template <>
struct JsonSchemaOf<bool> {
    static nlohmann::json schema() { return {{"type", "boolean"}}; }
};

template <>
struct JsonSchemaOf<std::string> {
    static nlohmann::json schema() { return {{"type", "string"}}; }
};

template <>
struct JsonSchemaOf<nlohmann::json> {
    static nlohmann::json schema() { return {{"type", "object"}}; }
};

template <typename T>
struct JsonSchemaOf<std::vector<T>> {
    static nlohmann::json schema() {
        return {{"type", "array"}, {"items", JsonSchemaOf<T>::schema()}};
    }
};

class ResponseCoercer {
public:
    // Drops the top-level "$schema" and "title" keys; some backends refuse
    // a response format that carries them.
    static nlohmann::json strip_schema_metadata(nlohmann::json schema);

    static protocol::ResponseFormat response_format(nlohmann::json schema);

    // Whole-text JSON parse; anything else is a Decode error.
    static core::errors::Result<nlohmann::json> parse_strict(const std::string& text);

    // Plain text answers attach no schema at all.
    template <typename T>
    static std::optional<protocol::ResponseFormat> format_for() {
        if constexpr (std::is_same_v<T, std::string>) {
            return std::nullopt;
        } else {
            return response_format(JsonSchemaOf<T>::schema());
        }
    }

    template <typename T>
    static core::errors::Result<T> decode(const std::string& text) {
        // Plain text is a JSON string holding the answer verbatim. Building
        // the value directly keeps bytes that are not valid UTF-8.
        if constexpr (std::is_same_v<T, std::string>) {
            const nlohmann::json wrapped = text;
            return wrapped.template get<std::string>();
        } else {
            auto parsed = parse_strict(text);
            if (core::errors::is_error(parsed)) {
                return core::errors::get_error(parsed);
            }
            const auto& value = core::errors::get_value(parsed);

            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
                return decode_integer<T>(text, value);
            } else {
                if constexpr (std::is_floating_point_v<T>) {
                    if (!value.is_number()) {
                        return decode_error(text, "expected a number");
                    }
                }
                try {
                    return value.template get<T>();
                } catch (const nlohmann::json::exception& e) {
                    return decode_error(text, e.what());
                }
            }
        }
    }

private:
    // get<T>() wraps out-of-range integers; check the bounds first.
    template <typename T>
    static core::errors::Result<T> decode_integer(const std::string& text,
                                                  const nlohmann::json& value) {
        if (!value.is_number_integer()) {
            return decode_error(text, "expected an integer");
        }
        if (value.is_number_unsigned()) {
            const auto number = value.get<std::uint64_t>();
            if (number > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                return decode_error(text, "integer out of range");
            }
            return static_cast<T>(number);
        }

        const auto number = value.get<std::int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            if (number < 0 ||
                static_cast<std::uint64_t>(number) > std::numeric_limits<T>::max()) {
                return decode_error(text, "integer out of range");
            }
        } else {
            if (number < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                number > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                return decode_error(text, "integer out of range");
            }
        }
        return static_cast<T>(number);
    }

    static core::errors::AgentError decode_error(const std::string& text,
                                                 const std::string& reason);
};

}  // namespace agentloop::runtime
