#pragma once

/// @file data_converter.h
/// @brief JSON conversion between handler payloads and service strings.

#include <any>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace swfcoord::converters {

/// Converts std::any payloads to and from the JSON strings carried in
/// service messages (task input, signal input, activity results).
///
/// Natively handles empty values (JSON null), nlohmann::json, std::string,
/// const char*, bool, int, int64_t, uint64_t and double. Other types can be
/// registered with register_type<T>() provided nlohmann::json can convert
/// them (to_json/from_json found by ADL).
class DataConverter {
public:
    DataConverter() = default;

    /// Serialize a payload to a JSON string.
    /// @throws std::invalid_argument if the payload type is not supported.
    std::string to_json(const std::any& value) const;

    /// Serialize a payload to a JSON document.
    /// @throws std::invalid_argument if the payload type is not supported.
    nlohmann::json to_json_value(const std::any& value) const;

    /// Parse a JSON string into an std::any holding nlohmann::json.
    /// An empty string yields an empty std::any.
    /// @throws std::invalid_argument on malformed JSON.
    std::any from_json(std::string_view json) const;

    /// Decode a payload previously produced by from_json (or already holding
    /// T) into T.
    /// @throws std::invalid_argument if the value cannot be converted.
    template <typename T>
    T decode(const std::any& value) const {
        if (value.type() == typeid(T)) {
            return std::any_cast<T>(value);
        }
        if (value.type() == typeid(nlohmann::json)) {
            try {
                return std::any_cast<const nlohmann::json&>(value).get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw std::invalid_argument(
                    std::string("Failed decoding payload: ") + e.what());
            }
        }
        throw std::invalid_argument(
            std::string("Cannot decode payload of type ") +
            value.type().name());
    }

    /// Register a user type serializable through nlohmann::json.
    template <typename T>
    void register_type() {
        serializers_[std::type_index(typeid(T))] =
            [](const std::any& v) -> nlohmann::json {
            return nlohmann::json(std::any_cast<const T&>(v));
        };
    }

private:
    std::unordered_map<std::type_index,
                       std::function<nlohmann::json(const std::any&)>>
        serializers_;
};

}  // namespace swfcoord::converters
