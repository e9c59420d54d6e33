#include "tgwire/codec/wire.hpp"

namespace tgwire::codec {

auto shape_mismatch(std::string_view expected, const json& actual) -> Error {
    return make_error(ErrorCode::SerializationError,
                      "Expected " + std::string(expected) + ", got " + actual.type_name());
}

auto missing_field(std::string_view wire_name) -> Error {
    return make_error(ErrorCode::SerializationError,
                      "Missing required field '" + std::string(wire_name) + "'");
}

} // namespace tgwire::codec
