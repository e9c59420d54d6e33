#include "tgwire/codec/variant.hpp"

namespace tgwire::codec {

auto kind_not_recognized(std::string_view kind_name, const json& raw) -> Error {
    // The raw node is kept verbatim in the detail for diagnostics.
    return Error(ErrorCode::KindNotRecognized,
                 "Unrecognized " + std::string(kind_name) + " value",
                 raw.dump(),
                 std::string(kind_name));
}

} // namespace tgwire::codec
