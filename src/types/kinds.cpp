#include "tgwire/types/kinds.hpp"

#include <algorithm>

#include "tgwire/codec/variant.hpp"

namespace tgwire::types {

namespace {

template <codec::UnionKind U>
auto make_kind_info() -> KindInfo {
    return KindInfo{
        .name = U::kind_name,
        .candidates = std::vector<std::string_view>(U::alternative_names.begin(),
                                                    U::alternative_names.end()),
        .decode = [](const json& j) -> Result<KindResolution> {
            auto decoded = codec::decode_union<U>(j);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return KindResolution{
                .index = decoded->index(),
                .alternative = std::string(decoded->alternative_name()),
                .value = codec::encode_union(*decoded),
            };
        },
    };
}

} // anonymous namespace

auto all_kinds() -> const std::vector<KindInfo>& {
    static const std::vector<KindInfo> kinds = {
        make_kind_info<ChatId>(),
        make_kind_info<FileOrPath>(),
        make_kind_info<ReplyMarkup>(),
        make_kind_info<InputMedia>(),
        make_kind_info<MediaGroupItem>(),
        make_kind_info<InputMessageContent>(),
        make_kind_info<InlineQueryResult>(),
        make_kind_info<PassportElementError>(),
    };
    return kinds;
}

auto find_kind(std::string_view name) -> const KindInfo* {
    const auto& kinds = all_kinds();
    auto it = std::find_if(kinds.begin(), kinds.end(),
                           [name](const KindInfo& k) { return k.name == name; });
    return it == kinds.end() ? nullptr : &*it;
}

} // namespace tgwire::types
