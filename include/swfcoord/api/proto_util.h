#pragma once

/// @file api/proto_util.h
/// @brief Wire encoding of swfcoord service messages.

#include <climits>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/message.h>

namespace swfcoord::api {

/// Encode a service message as the bytes a poller hands to the worker.
/// @throws std::runtime_error if the message cannot be encoded.
inline std::string encode_message(const google::protobuf::Message& msg) {
    std::string bytes;
    if (!msg.SerializeToString(&bytes)) {
        throw std::runtime_error("Cannot encode " + msg.GetTypeName());
    }
    return bytes;
}

/// Decode a service message without copying the input.
/// @throws std::runtime_error if the bytes are not a valid T.
template <typename T>
T decode_message(std::string_view bytes) {
    T msg;
    if (bytes.size() > static_cast<std::size_t>(INT_MAX) ||
        !msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw std::runtime_error("Cannot decode " + msg.GetTypeName() +
                                 " from " + std::to_string(bytes.size()) +
                                 " bytes");
    }
    return msg;
}

/// Decode a service message held in a byte buffer.
template <typename T>
T decode_message(const std::vector<uint8_t>& bytes) {
    return decode_message<T>(std::string_view(
        reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

}  // namespace swfcoord::api
