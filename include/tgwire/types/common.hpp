#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "tgwire/codec/variant.hpp"
#include "tgwire/codec/wire.hpp"

namespace tgwire::types {

using codec::field;

struct User {
    std::int64_t id = 0;
    bool is_bot = false;
    std::string first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> username;
    std::optional<std::string> language_code;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("id", &User::id),
            field("is_bot", &User::is_bot),
            field("first_name", &User::first_name),
            field("last_name", &User::last_name),
            field("username", &User::username),
            field("language_code", &User::language_code),
        };
    }

    auto operator==(const User&) const -> bool = default;
};

/// A styled span of message text ("bold", "text_link", "text_mention", ...).
struct MessageEntity {
    std::string type;
    std::int64_t offset = 0;
    std::int64_t length = 0;
    std::optional<std::string> url;
    std::optional<User> user;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("type", &MessageEntity::type),
            field("offset", &MessageEntity::offset),
            field("length", &MessageEntity::length),
            field("url", &MessageEntity::url),
            field("user", &MessageEntity::user),
        };
    }

    auto operator==(const MessageEntity&) const -> bool = default;
};

struct BotCommand {
    std::string command;
    std::string description;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("command", &BotCommand::command),
            field("description", &BotCommand::description),
        };
    }

    auto operator==(const BotCommand&) const -> bool = default;
};

/// Price portion in the smallest units of the currency.
struct LabeledPrice {
    std::string label;
    std::int64_t amount = 0;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("label", &LabeledPrice::label),
            field("amount", &LabeledPrice::amount),
        };
    }

    auto operator==(const LabeledPrice&) const -> bool = default;
};

/// Marker for content uploaded as a multipart part rather than referenced
/// by id or URL. Carries no fields: encodes as `{}` and accepts any object.
struct InputFile {
    static constexpr auto wire_fields() { return std::tuple{}; }

    auto operator==(const InputFile&) const -> bool = default;
};

// ---------------------------------------------------------------------------
// Union kinds
// ---------------------------------------------------------------------------

/// Unique chat identifier or `@channelusername`.
struct ChatId : codec::Union<ChatId, std::int64_t, std::string> {
    using Union::Union;

    static constexpr std::string_view kind_name = "ChatId";
    static constexpr std::array<std::string_view, 2> alternative_names{"integer", "string"};
};

/// Either an uploaded file or a file id / URL string.
struct FileOrPath : codec::Union<FileOrPath, InputFile, std::string> {
    using Union::Union;

    static constexpr std::string_view kind_name = "FileOrPath";
    static constexpr std::array<std::string_view, 2> alternative_names{"InputFile", "string"};
};

} // namespace tgwire::types
