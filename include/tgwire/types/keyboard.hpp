#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "tgwire/codec/variant.hpp"
#include "tgwire/codec/wire.hpp"

namespace tgwire::types {

using codec::field;

struct KeyboardButton {
    std::string text;
    std::optional<bool> request_contact;
    std::optional<bool> request_location;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("text", &KeyboardButton::text),
            field("request_contact", &KeyboardButton::request_contact),
            field("request_location", &KeyboardButton::request_location),
        };
    }

    auto operator==(const KeyboardButton&) const -> bool = default;
};

/// Custom keyboard, one inner vector per row.
struct ReplyKeyboardMarkup {
    std::vector<std::vector<KeyboardButton>> keyboard;
    std::optional<bool> resize_keyboard;
    std::optional<bool> one_time_keyboard;
    std::optional<bool> selective;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("keyboard", &ReplyKeyboardMarkup::keyboard),
            field("resize_keyboard", &ReplyKeyboardMarkup::resize_keyboard),
            field("one_time_keyboard", &ReplyKeyboardMarkup::one_time_keyboard),
            field("selective", &ReplyKeyboardMarkup::selective),
        };
    }

    auto operator==(const ReplyKeyboardMarkup&) const -> bool = default;
};

struct ReplyKeyboardRemove {
    bool remove_keyboard = true;
    std::optional<bool> selective;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("remove_keyboard", &ReplyKeyboardRemove::remove_keyboard),
            field("selective", &ReplyKeyboardRemove::selective),
        };
    }

    auto operator==(const ReplyKeyboardRemove&) const -> bool = default;
};

/// Placeholder sent with a button that launches a game.
struct CallbackGame {
    static constexpr auto wire_fields() { return std::tuple{}; }

    auto operator==(const CallbackGame&) const -> bool = default;
};

struct InlineKeyboardButton {
    std::string text;
    std::optional<std::string> url;
    std::optional<std::string> callback_data;
    std::optional<std::string> switch_inline_query;
    std::optional<std::string> switch_inline_query_current_chat;
    std::optional<CallbackGame> callback_game;
    std::optional<bool> pay;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("text", &InlineKeyboardButton::text),
            field("url", &InlineKeyboardButton::url),
            field("callback_data", &InlineKeyboardButton::callback_data),
            field("switch_inline_query", &InlineKeyboardButton::switch_inline_query),
            field("switch_inline_query_current_chat",
                  &InlineKeyboardButton::switch_inline_query_current_chat),
            field("callback_game", &InlineKeyboardButton::callback_game),
            field("pay", &InlineKeyboardButton::pay),
        };
    }

    auto operator==(const InlineKeyboardButton&) const -> bool = default;
};

struct InlineKeyboardMarkup {
    std::vector<std::vector<InlineKeyboardButton>> inline_keyboard;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("inline_keyboard", &InlineKeyboardMarkup::inline_keyboard),
        };
    }

    auto operator==(const InlineKeyboardMarkup&) const -> bool = default;
};

struct ForceReply {
    bool force_reply = true;
    std::optional<bool> selective;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("force_reply", &ForceReply::force_reply),
            field("selective", &ForceReply::selective),
        };
    }

    auto operator==(const ForceReply&) const -> bool = default;
};

/// The `reply_markup` parameter of the send* methods. An object carrying
/// `inline_keyboard` resolves to the inline keyboard even when it also
/// has a `keyboard` key.
struct ReplyMarkup : codec::Union<ReplyMarkup,
                                  InlineKeyboardMarkup,
                                  ReplyKeyboardMarkup,
                                  ReplyKeyboardRemove,
                                  ForceReply> {
    using Union::Union;

    static constexpr std::string_view kind_name = "ReplyMarkup";
    static constexpr std::array<std::string_view, 4> alternative_names{
        "InlineKeyboardMarkup", "ReplyKeyboardMarkup", "ReplyKeyboardRemove", "ForceReply"};
};

} // namespace tgwire::types
