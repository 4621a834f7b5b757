#include "swfcoord/converters/data_converter.h"

#include <cstdint>
#include <stdexcept>

namespace swfcoord::converters {

nlohmann::json DataConverter::to_json_value(const std::any& value) const {
    if (!value.has_value()) {
        return nullptr;
    }
    auto type_idx = std::type_index(value.type());

    if (type_idx == std::type_index(typeid(nlohmann::json))) {
        return std::any_cast<const nlohmann::json&>(value);
    }
    if (type_idx == std::type_index(typeid(std::string))) {
        return std::any_cast<const std::string&>(value);
    }
    if (type_idx == std::type_index(typeid(const char*))) {
        return std::string(std::any_cast<const char*>(value));
    }
    if (type_idx == std::type_index(typeid(bool))) {
        return std::any_cast<bool>(value);
    }
    if (type_idx == std::type_index(typeid(int))) {
        return std::any_cast<int>(value);
    }
    if (type_idx == std::type_index(typeid(int64_t))) {
        return std::any_cast<int64_t>(value);
    }
    if (type_idx == std::type_index(typeid(uint64_t))) {
        return std::any_cast<uint64_t>(value);
    }
    if (type_idx == std::type_index(typeid(double))) {
        return std::any_cast<double>(value);
    }

    auto it = serializers_.find(type_idx);
    if (it != serializers_.end()) {
        return it->second(value);
    }

    throw std::invalid_argument(
        std::string("No JSON conversion registered for payload type ") +
        value.type().name());
}

std::string DataConverter::to_json(const std::any& value) const {
    return to_json_value(value).dump();
}

std::any DataConverter::from_json(std::string_view json) const {
    if (json.empty()) {
        return {};
    }
    auto parsed = nlohmann::json::parse(json, nullptr, false);
    if (parsed.is_discarded()) {
        throw std::invalid_argument("Payload is not valid JSON");
    }
    return std::any(std::move(parsed));
}

}  // namespace swfcoord::converters
