#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tgwire/core/error.hpp"
#include "tgwire/types/common.hpp"
#include "tgwire/types/inline_query.hpp"
#include "tgwire/types/input_media.hpp"
#include "tgwire/types/keyboard.hpp"
#include "tgwire/types/passport.hpp"

namespace tgwire::types {

using json = nlohmann::json;

/// Outcome of decoding a node against a named union kind.
struct KindResolution {
    std::size_t index = 0;
    std::string alternative;
    json value;  // the resolved alternative, re-encoded
};

/// Runtime handle on a union kind, used where the kind is only known by
/// name (the CLI).
struct KindInfo {
    std::string_view name;
    std::vector<std::string_view> candidates;
    std::function<Result<KindResolution>(const json&)> decode;
};

/// Every union kind of the catalogue, in a stable order.
auto all_kinds() -> const std::vector<KindInfo>&;

/// Case-sensitive lookup by kind name; nullptr when unknown.
auto find_kind(std::string_view name) -> const KindInfo*;

} // namespace tgwire::types
