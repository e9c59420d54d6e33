#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "tgwire/codec/variant.hpp"
#include "tgwire/codec/wire.hpp"
#include "tgwire/types/keyboard.hpp"

namespace tgwire::types {

using codec::field;

// ---------------------------------------------------------------------------
// Input message contents
// ---------------------------------------------------------------------------

struct InputTextMessageContent {
    std::string message_text;
    std::optional<std::string> parse_mode;
    std::optional<bool> disable_web_page_preview;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("message_text", &InputTextMessageContent::message_text),
            field("parse_mode", &InputTextMessageContent::parse_mode),
            field("disable_web_page_preview",
                  &InputTextMessageContent::disable_web_page_preview),
        };
    }

    auto operator==(const InputTextMessageContent&) const -> bool = default;
};

struct InputLocationMessageContent {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<std::int64_t> live_period;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("latitude", &InputLocationMessageContent::latitude),
            field("longitude", &InputLocationMessageContent::longitude),
            field("live_period", &InputLocationMessageContent::live_period),
        };
    }

    auto operator==(const InputLocationMessageContent&) const -> bool = default;
};

struct InputVenueMessageContent {
    double latitude = 0.0;
    double longitude = 0.0;
    std::string title;
    std::string address;
    std::optional<std::string> foursquare_id;
    std::optional<std::string> foursquare_type;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("latitude", &InputVenueMessageContent::latitude),
            field("longitude", &InputVenueMessageContent::longitude),
            field("title", &InputVenueMessageContent::title),
            field("address", &InputVenueMessageContent::address),
            field("foursquare_id", &InputVenueMessageContent::foursquare_id),
            field("foursquare_type", &InputVenueMessageContent::foursquare_type),
        };
    }

    auto operator==(const InputVenueMessageContent&) const -> bool = default;
};

struct InputContactMessageContent {
    std::string phone_number;
    std::string first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> vcard;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("phone_number", &InputContactMessageContent::phone_number),
            field("first_name", &InputContactMessageContent::first_name),
            field("last_name", &InputContactMessageContent::last_name),
            field("vcard", &InputContactMessageContent::vcard),
        };
    }

    auto operator==(const InputContactMessageContent&) const -> bool = default;
};

/// Content of the message sent in place of an inline query result.
/// Text requires `message_text`; location requires the coordinates; venue
/// additionally needs `title` and `address`; contact needs `phone_number`
/// and `first_name`.
struct InputMessageContent : codec::Union<InputMessageContent,
                                          InputTextMessageContent,
                                          InputLocationMessageContent,
                                          InputVenueMessageContent,
                                          InputContactMessageContent> {
    using Union::Union;

    static constexpr std::string_view kind_name = "InputMessageContent";
    static constexpr std::array<std::string_view, 4> alternative_names{
        "InputTextMessageContent", "InputLocationMessageContent",
        "InputVenueMessageContent", "InputContactMessageContent"};
};

// ---------------------------------------------------------------------------
// Inline query results
// ---------------------------------------------------------------------------

struct InlineQueryResultCachedAudio {
    std::string type = "audio";
    std::string id;
    std::string audio_file_id;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedAudio::type),
            field("id", &InlineQueryResultCachedAudio::id),
            field("audio_file_id", &InlineQueryResultCachedAudio::audio_file_id),
            field("caption", &InlineQueryResultCachedAudio::caption),
            field("parse_mode", &InlineQueryResultCachedAudio::parse_mode),
            field("reply_markup", &InlineQueryResultCachedAudio::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedAudio::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedAudio&) const -> bool = default;
};

struct InlineQueryResultCachedDocument {
    std::string type = "document";
    std::string id;
    std::string title;
    std::string document_file_id;
    std::optional<std::string> description;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedDocument::type),
            field("id", &InlineQueryResultCachedDocument::id),
            field("title", &InlineQueryResultCachedDocument::title),
            field("document_file_id", &InlineQueryResultCachedDocument::document_file_id),
            field("description", &InlineQueryResultCachedDocument::description),
            field("caption", &InlineQueryResultCachedDocument::caption),
            field("parse_mode", &InlineQueryResultCachedDocument::parse_mode),
            field("reply_markup", &InlineQueryResultCachedDocument::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedDocument::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedDocument&) const -> bool = default;
};

struct InlineQueryResultCachedGif {
    std::string type = "gif";
    std::string id;
    std::string gif_file_id;
    std::optional<std::string> title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedGif::type),
            field("id", &InlineQueryResultCachedGif::id),
            field("gif_file_id", &InlineQueryResultCachedGif::gif_file_id),
            field("title", &InlineQueryResultCachedGif::title),
            field("caption", &InlineQueryResultCachedGif::caption),
            field("parse_mode", &InlineQueryResultCachedGif::parse_mode),
            field("reply_markup", &InlineQueryResultCachedGif::reply_markup),
            field("input_message_content", &InlineQueryResultCachedGif::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedGif&) const -> bool = default;
};

struct InlineQueryResultCachedMpeg4Gif {
    std::string type = "mpeg4_gif";
    std::string id;
    std::string mpeg4_file_id;
    std::optional<std::string> title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedMpeg4Gif::type),
            field("id", &InlineQueryResultCachedMpeg4Gif::id),
            field("mpeg4_file_id", &InlineQueryResultCachedMpeg4Gif::mpeg4_file_id),
            field("title", &InlineQueryResultCachedMpeg4Gif::title),
            field("caption", &InlineQueryResultCachedMpeg4Gif::caption),
            field("parse_mode", &InlineQueryResultCachedMpeg4Gif::parse_mode),
            field("reply_markup", &InlineQueryResultCachedMpeg4Gif::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedMpeg4Gif::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedMpeg4Gif&) const -> bool = default;
};

struct InlineQueryResultCachedPhoto {
    std::string type = "photo";
    std::string id;
    std::string photo_file_id;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedPhoto::type),
            field("id", &InlineQueryResultCachedPhoto::id),
            field("photo_file_id", &InlineQueryResultCachedPhoto::photo_file_id),
            field("title", &InlineQueryResultCachedPhoto::title),
            field("description", &InlineQueryResultCachedPhoto::description),
            field("caption", &InlineQueryResultCachedPhoto::caption),
            field("parse_mode", &InlineQueryResultCachedPhoto::parse_mode),
            field("reply_markup", &InlineQueryResultCachedPhoto::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedPhoto::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedPhoto&) const -> bool = default;
};

/// Sticker stored on the Telegram servers, referenced by file id.
struct InlineQueryResultCachedSticker {
    std::string type = "sticker";
    std::string id;
    std::string sticker_file_id;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedSticker::type),
            field("id", &InlineQueryResultCachedSticker::id),
            field("sticker_file_id", &InlineQueryResultCachedSticker::sticker_file_id),
            field("reply_markup", &InlineQueryResultCachedSticker::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedSticker::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedSticker&) const -> bool = default;
};

struct InlineQueryResultCachedVideo {
    std::string type = "video";
    std::string id;
    std::string video_file_id;
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedVideo::type),
            field("id", &InlineQueryResultCachedVideo::id),
            field("video_file_id", &InlineQueryResultCachedVideo::video_file_id),
            field("title", &InlineQueryResultCachedVideo::title),
            field("description", &InlineQueryResultCachedVideo::description),
            field("caption", &InlineQueryResultCachedVideo::caption),
            field("parse_mode", &InlineQueryResultCachedVideo::parse_mode),
            field("reply_markup", &InlineQueryResultCachedVideo::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedVideo::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedVideo&) const -> bool = default;
};

struct InlineQueryResultCachedVoice {
    std::string type = "voice";
    std::string id;
    std::string voice_file_id;
    std::string title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultCachedVoice::type),
            field("id", &InlineQueryResultCachedVoice::id),
            field("voice_file_id", &InlineQueryResultCachedVoice::voice_file_id),
            field("title", &InlineQueryResultCachedVoice::title),
            field("caption", &InlineQueryResultCachedVoice::caption),
            field("parse_mode", &InlineQueryResultCachedVoice::parse_mode),
            field("reply_markup", &InlineQueryResultCachedVoice::reply_markup),
            field("input_message_content",
                  &InlineQueryResultCachedVoice::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultCachedVoice&) const -> bool = default;
};

/// Link to an article or web page.
struct InlineQueryResultArticle {
    std::string type = "article";
    std::string id;
    std::string title;
    InputMessageContent input_message_content;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<std::string> url;
    std::optional<bool> hide_url;
    std::optional<std::string> description;
    std::optional<std::string> thumb_url;
    std::optional<std::int64_t> thumb_width;
    std::optional<std::int64_t> thumb_height;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultArticle::type),
            field("id", &InlineQueryResultArticle::id),
            field("title", &InlineQueryResultArticle::title),
            field("input_message_content", &InlineQueryResultArticle::input_message_content),
            field("reply_markup", &InlineQueryResultArticle::reply_markup),
            field("url", &InlineQueryResultArticle::url),
            field("hide_url", &InlineQueryResultArticle::hide_url),
            field("description", &InlineQueryResultArticle::description),
            field("thumb_url", &InlineQueryResultArticle::thumb_url),
            field("thumb_width", &InlineQueryResultArticle::thumb_width),
            field("thumb_height", &InlineQueryResultArticle::thumb_height),
        };
    }

    auto operator==(const InlineQueryResultArticle&) const -> bool = default;
};

struct InlineQueryResultAudio {
    std::string type = "audio";
    std::string id;
    std::string audio_url;
    std::string title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<std::string> performer;
    std::optional<std::int64_t> audio_duration;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultAudio::type),
            field("id", &InlineQueryResultAudio::id),
            field("audio_url", &InlineQueryResultAudio::audio_url),
            field("title", &InlineQueryResultAudio::title),
            field("caption", &InlineQueryResultAudio::caption),
            field("parse_mode", &InlineQueryResultAudio::parse_mode),
            field("performer", &InlineQueryResultAudio::performer),
            field("audio_duration", &InlineQueryResultAudio::audio_duration),
            field("reply_markup", &InlineQueryResultAudio::reply_markup),
            field("input_message_content", &InlineQueryResultAudio::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultAudio&) const -> bool = default;
};

struct InlineQueryResultContact {
    std::string type = "contact";
    std::string id;
    std::string phone_number;
    std::string first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> vcard;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;
    std::optional<std::string> thumb_url;
    std::optional<std::int64_t> thumb_width;
    std::optional<std::int64_t> thumb_height;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultContact::type),
            field("id", &InlineQueryResultContact::id),
            field("phone_number", &InlineQueryResultContact::phone_number),
            field("first_name", &InlineQueryResultContact::first_name),
            field("last_name", &InlineQueryResultContact::last_name),
            field("vcard", &InlineQueryResultContact::vcard),
            field("reply_markup", &InlineQueryResultContact::reply_markup),
            field("input_message_content", &InlineQueryResultContact::input_message_content),
            field("thumb_url", &InlineQueryResultContact::thumb_url),
            field("thumb_width", &InlineQueryResultContact::thumb_width),
            field("thumb_height", &InlineQueryResultContact::thumb_height),
        };
    }

    auto operator==(const InlineQueryResultContact&) const -> bool = default;
};

/// Game result. Carries no input_message_content.
struct InlineQueryResultGame {
    std::string type = "game";
    std::string id;
    std::string game_short_name;
    std::optional<InlineKeyboardMarkup> reply_markup;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultGame::type),
            field("id", &InlineQueryResultGame::id),
            field("game_short_name", &InlineQueryResultGame::game_short_name),
            field("reply_markup", &InlineQueryResultGame::reply_markup),
        };
    }

    auto operator==(const InlineQueryResultGame&) const -> bool = default;
};

struct InlineQueryResultDocument {
    std::string type = "document";
    std::string id;
    std::string title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::string document_url;
    std::string mime_type;
    std::optional<std::string> description;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;
    std::optional<std::string> thumb_url;
    std::optional<std::int64_t> thumb_width;
    std::optional<std::int64_t> thumb_height;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultDocument::type),
            field("id", &InlineQueryResultDocument::id),
            field("title", &InlineQueryResultDocument::title),
            field("caption", &InlineQueryResultDocument::caption),
            field("parse_mode", &InlineQueryResultDocument::parse_mode),
            field("document_url", &InlineQueryResultDocument::document_url),
            field("mime_type", &InlineQueryResultDocument::mime_type),
            field("description", &InlineQueryResultDocument::description),
            field("reply_markup", &InlineQueryResultDocument::reply_markup),
            field("input_message_content", &InlineQueryResultDocument::input_message_content),
            field("thumb_url", &InlineQueryResultDocument::thumb_url),
            field("thumb_width", &InlineQueryResultDocument::thumb_width),
            field("thumb_height", &InlineQueryResultDocument::thumb_height),
        };
    }

    auto operator==(const InlineQueryResultDocument&) const -> bool = default;
};

struct InlineQueryResultGif {
    std::string type = "gif";
    std::string id;
    std::string gif_url;
    std::optional<std::int64_t> gif_width;
    std::optional<std::int64_t> gif_height;
    std::optional<std::int64_t> gif_duration;
    std::string thumb_url;
    std::optional<std::string> title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultGif::type),
            field("id", &InlineQueryResultGif::id),
            field("gif_url", &InlineQueryResultGif::gif_url),
            field("gif_width", &InlineQueryResultGif::gif_width),
            field("gif_height", &InlineQueryResultGif::gif_height),
            field("gif_duration", &InlineQueryResultGif::gif_duration),
            field("thumb_url", &InlineQueryResultGif::thumb_url),
            field("title", &InlineQueryResultGif::title),
            field("caption", &InlineQueryResultGif::caption),
            field("parse_mode", &InlineQueryResultGif::parse_mode),
            field("reply_markup", &InlineQueryResultGif::reply_markup),
            field("input_message_content", &InlineQueryResultGif::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultGif&) const -> bool = default;
};

/// Location on a map; latitude and longitude accept any JSON number.
struct InlineQueryResultLocation {
    std::string type = "location";
    std::string id;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string title;
    std::optional<std::int64_t> live_period;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;
    std::optional<std::string> thumb_url;
    std::optional<std::int64_t> thumb_width;
    std::optional<std::int64_t> thumb_height;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultLocation::type),
            field("id", &InlineQueryResultLocation::id),
            field("latitude", &InlineQueryResultLocation::latitude),
            field("longitude", &InlineQueryResultLocation::longitude),
            field("title", &InlineQueryResultLocation::title),
            field("live_period", &InlineQueryResultLocation::live_period),
            field("reply_markup", &InlineQueryResultLocation::reply_markup),
            field("input_message_content", &InlineQueryResultLocation::input_message_content),
            field("thumb_url", &InlineQueryResultLocation::thumb_url),
            field("thumb_width", &InlineQueryResultLocation::thumb_width),
            field("thumb_height", &InlineQueryResultLocation::thumb_height),
        };
    }

    auto operator==(const InlineQueryResultLocation&) const -> bool = default;
};

struct InlineQueryResultMpeg4Gif {
    std::string type = "mpeg4_gif";
    std::string id;
    std::string mpeg4_url;
    std::optional<std::int64_t> mpeg4_width;
    std::optional<std::int64_t> mpeg4_height;
    std::optional<std::int64_t> mpeg4_duration;
    std::string thumb_url;
    std::optional<std::string> title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultMpeg4Gif::type),
            field("id", &InlineQueryResultMpeg4Gif::id),
            field("mpeg4_url", &InlineQueryResultMpeg4Gif::mpeg4_url),
            field("mpeg4_width", &InlineQueryResultMpeg4Gif::mpeg4_width),
            field("mpeg4_height", &InlineQueryResultMpeg4Gif::mpeg4_height),
            field("mpeg4_duration", &InlineQueryResultMpeg4Gif::mpeg4_duration),
            field("thumb_url", &InlineQueryResultMpeg4Gif::thumb_url),
            field("title", &InlineQueryResultMpeg4Gif::title),
            field("caption", &InlineQueryResultMpeg4Gif::caption),
            field("parse_mode", &InlineQueryResultMpeg4Gif::parse_mode),
            field("reply_markup", &InlineQueryResultMpeg4Gif::reply_markup),
            field("input_message_content", &InlineQueryResultMpeg4Gif::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultMpeg4Gif&) const -> bool = default;
};

struct InlineQueryResultPhoto {
    std::string type = "photo";
    std::string id;
    std::string photo_url;
    std::string thumb_url;
    std::optional<std::int64_t> photo_width;
    std::optional<std::int64_t> photo_height;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultPhoto::type),
            field("id", &InlineQueryResultPhoto::id),
            field("photo_url", &InlineQueryResultPhoto::photo_url),
            field("thumb_url", &InlineQueryResultPhoto::thumb_url),
            field("photo_width", &InlineQueryResultPhoto::photo_width),
            field("photo_height", &InlineQueryResultPhoto::photo_height),
            field("title", &InlineQueryResultPhoto::title),
            field("description", &InlineQueryResultPhoto::description),
            field("caption", &InlineQueryResultPhoto::caption),
            field("parse_mode", &InlineQueryResultPhoto::parse_mode),
            field("reply_markup", &InlineQueryResultPhoto::reply_markup),
            field("input_message_content", &InlineQueryResultPhoto::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultPhoto&) const -> bool = default;
};

struct InlineQueryResultVenue {
    std::string type = "venue";
    std::string id;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string title;
    std::string address;
    std::optional<std::string> foursquare_id;
    std::optional<std::string> foursquare_type;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;
    std::optional<std::string> thumb_url;
    std::optional<std::int64_t> thumb_width;
    std::optional<std::int64_t> thumb_height;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultVenue::type),
            field("id", &InlineQueryResultVenue::id),
            field("latitude", &InlineQueryResultVenue::latitude),
            field("longitude", &InlineQueryResultVenue::longitude),
            field("title", &InlineQueryResultVenue::title),
            field("address", &InlineQueryResultVenue::address),
            field("foursquare_id", &InlineQueryResultVenue::foursquare_id),
            field("foursquare_type", &InlineQueryResultVenue::foursquare_type),
            field("reply_markup", &InlineQueryResultVenue::reply_markup),
            field("input_message_content", &InlineQueryResultVenue::input_message_content),
            field("thumb_url", &InlineQueryResultVenue::thumb_url),
            field("thumb_width", &InlineQueryResultVenue::thumb_width),
            field("thumb_height", &InlineQueryResultVenue::thumb_height),
        };
    }

    auto operator==(const InlineQueryResultVenue&) const -> bool = default;
};

struct InlineQueryResultVideo {
    std::string type = "video";
    std::string id;
    std::string video_url;
    std::string mime_type;
    std::string thumb_url;
    std::string title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<std::int64_t> video_width;
    std::optional<std::int64_t> video_height;
    std::optional<std::int64_t> video_duration;
    std::optional<std::string> description;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultVideo::type),
            field("id", &InlineQueryResultVideo::id),
            field("video_url", &InlineQueryResultVideo::video_url),
            field("mime_type", &InlineQueryResultVideo::mime_type),
            field("thumb_url", &InlineQueryResultVideo::thumb_url),
            field("title", &InlineQueryResultVideo::title),
            field("caption", &InlineQueryResultVideo::caption),
            field("parse_mode", &InlineQueryResultVideo::parse_mode),
            field("video_width", &InlineQueryResultVideo::video_width),
            field("video_height", &InlineQueryResultVideo::video_height),
            field("video_duration", &InlineQueryResultVideo::video_duration),
            field("description", &InlineQueryResultVideo::description),
            field("reply_markup", &InlineQueryResultVideo::reply_markup),
            field("input_message_content", &InlineQueryResultVideo::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultVideo&) const -> bool = default;
};

struct InlineQueryResultVoice {
    std::string type = "voice";
    std::string id;
    std::string voice_url;
    std::string title;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<std::int64_t> voice_duration;
    std::optional<InlineKeyboardMarkup> reply_markup;
    std::optional<InputMessageContent> input_message_content;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &InlineQueryResultVoice::type),
            field("id", &InlineQueryResultVoice::id),
            field("voice_url", &InlineQueryResultVoice::voice_url),
            field("title", &InlineQueryResultVoice::title),
            field("caption", &InlineQueryResultVoice::caption),
            field("parse_mode", &InlineQueryResultVoice::parse_mode),
            field("voice_duration", &InlineQueryResultVoice::voice_duration),
            field("reply_markup", &InlineQueryResultVoice::reply_markup),
            field("input_message_content", &InlineQueryResultVoice::input_message_content),
        };
    }

    auto operator==(const InlineQueryResultVoice&) const -> bool = default;
};

/// One result of answerInlineQuery. Cached variants are tried before the
/// URL based ones, in this order.
struct InlineQueryResult : codec::Union<InlineQueryResult,
                                        InlineQueryResultCachedAudio,
                                        InlineQueryResultCachedDocument,
                                        InlineQueryResultCachedGif,
                                        InlineQueryResultCachedMpeg4Gif,
                                        InlineQueryResultCachedPhoto,
                                        InlineQueryResultCachedSticker,
                                        InlineQueryResultCachedVideo,
                                        InlineQueryResultCachedVoice,
                                        InlineQueryResultArticle,
                                        InlineQueryResultAudio,
                                        InlineQueryResultContact,
                                        InlineQueryResultGame,
                                        InlineQueryResultDocument,
                                        InlineQueryResultGif,
                                        InlineQueryResultLocation,
                                        InlineQueryResultMpeg4Gif,
                                        InlineQueryResultPhoto,
                                        InlineQueryResultVenue,
                                        InlineQueryResultVideo,
                                        InlineQueryResultVoice> {
    using Union::Union;

    static constexpr std::string_view kind_name = "InlineQueryResult";
    static constexpr std::array<std::string_view, 20> alternative_names{
        "InlineQueryResultCachedAudio", "InlineQueryResultCachedDocument",
        "InlineQueryResultCachedGif", "InlineQueryResultCachedMpeg4Gif",
        "InlineQueryResultCachedPhoto", "InlineQueryResultCachedSticker",
        "InlineQueryResultCachedVideo", "InlineQueryResultCachedVoice",
        "InlineQueryResultArticle", "InlineQueryResultAudio",
        "InlineQueryResultContact", "InlineQueryResultGame",
        "InlineQueryResultDocument", "InlineQueryResultGif",
        "InlineQueryResultLocation", "InlineQueryResultMpeg4Gif",
        "InlineQueryResultPhoto", "InlineQueryResultVenue",
        "InlineQueryResultVideo", "InlineQueryResultVoice"};
};

} // namespace tgwire::types
