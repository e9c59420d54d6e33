#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "tgwire/codec/variant.hpp"
#include "tgwire/codec/wire.hpp"
#include "tgwire/types/common.hpp"

namespace tgwire::types {

using codec::field;

// The `type` member is written on encode but its value is not checked on
// decode: every InputMedia record shares `type` and `media`.

struct InputMediaPhoto {
    std::string type = "photo";
    std::string media;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InputMediaPhoto::type),
            field("media", &InputMediaPhoto::media),
            field("caption", &InputMediaPhoto::caption),
            field("parse_mode", &InputMediaPhoto::parse_mode),
        };
    }

    auto operator==(const InputMediaPhoto&) const -> bool = default;
};

struct InputMediaVideo {
    std::string type = "video";
    std::string media;
    std::optional<FileOrPath> thumb;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<std::int64_t> width;
    std::optional<std::int64_t> height;
    std::optional<std::int64_t> duration;
    std::optional<bool> supports_streaming;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InputMediaVideo::type),
            field("media", &InputMediaVideo::media),
            field("thumb", &InputMediaVideo::thumb),
            field("caption", &InputMediaVideo::caption),
            field("parse_mode", &InputMediaVideo::parse_mode),
            field("width", &InputMediaVideo::width),
            field("height", &InputMediaVideo::height),
            field("duration", &InputMediaVideo::duration),
            field("supports_streaming", &InputMediaVideo::supports_streaming),
        };
    }

    auto operator==(const InputMediaVideo&) const -> bool = default;
};

struct InputMediaAnimation {
    std::string type = "animation";
    std::string media;
    std::optional<FileOrPath> thumb;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<std::int64_t> width;
    std::optional<std::int64_t> height;
    std::optional<std::int64_t> duration;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InputMediaAnimation::type),
            field("media", &InputMediaAnimation::media),
            field("thumb", &InputMediaAnimation::thumb),
            field("caption", &InputMediaAnimation::caption),
            field("parse_mode", &InputMediaAnimation::parse_mode),
            field("width", &InputMediaAnimation::width),
            field("height", &InputMediaAnimation::height),
            field("duration", &InputMediaAnimation::duration),
        };
    }

    auto operator==(const InputMediaAnimation&) const -> bool = default;
};

struct InputMediaAudio {
    std::string type = "audio";
    std::string media;
    std::optional<FileOrPath> thumb;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<std::int64_t> duration;
    std::optional<std::string> performer;
    std::optional<std::string> title;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InputMediaAudio::type),
            field("media", &InputMediaAudio::media),
            field("thumb", &InputMediaAudio::thumb),
            field("caption", &InputMediaAudio::caption),
            field("parse_mode", &InputMediaAudio::parse_mode),
            field("duration", &InputMediaAudio::duration),
            field("performer", &InputMediaAudio::performer),
            field("title", &InputMediaAudio::title),
        };
    }

    auto operator==(const InputMediaAudio&) const -> bool = default;
};

struct InputMediaDocument {
    std::string type = "document";
    std::string media;
    std::optional<FileOrPath> thumb;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InputMediaDocument::type),
            field("media", &InputMediaDocument::media),
            field("thumb", &InputMediaDocument::thumb),
            field("caption", &InputMediaDocument::caption),
            field("parse_mode", &InputMediaDocument::parse_mode),
        };
    }

    auto operator==(const InputMediaDocument&) const -> bool = default;
};

/// Content of a media message to be sent, as taken by editMessageMedia.
/// Any object with string `type` and `media` decodes as the first
/// candidate (InputMediaAnimation).
struct InputMedia : codec::Union<InputMedia,
                                 InputMediaAnimation,
                                 InputMediaDocument,
                                 InputMediaAudio,
                                 InputMediaPhoto,
                                 InputMediaVideo> {
    using Union::Union;

    static constexpr std::string_view kind_name = "InputMedia";
    static constexpr std::array<std::string_view, 5> alternative_names{
        "InputMediaAnimation", "InputMediaDocument", "InputMediaAudio",
        "InputMediaPhoto", "InputMediaVideo"};
};

/// One element of a sendMediaGroup album.
struct MediaGroupItem : codec::Union<MediaGroupItem,
                                     InputMediaAudio,
                                     InputMediaDocument,
                                     InputMediaPhoto,
                                     InputMediaVideo> {
    using Union::Union;

    static constexpr std::string_view kind_name = "MediaGroupItem";
    static constexpr std::array<std::string_view, 4> alternative_names{
        "InputMediaAudio", "InputMediaDocument", "InputMediaPhoto", "InputMediaVideo"};
};

} // namespace tgwire::types
