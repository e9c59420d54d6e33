#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tgwire/request/request.hpp"
#include "tgwire/types/common.hpp"
#include "tgwire/types/inline_query.hpp"
#include "tgwire/types/input_media.hpp"
#include "tgwire/types/keyboard.hpp"
#include "tgwire/types/passport.hpp"

namespace tgwire::methods {

// Parameter sets of the Bot API methods. Members mirror the wire names;
// optional members left empty are not sent.

struct GetUpdates {
    std::optional<std::int64_t> offset;
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> timeout;
    std::optional<std::vector<std::string>> allowed_updates;
};

struct SendMessage {
    types::ChatId chat_id;
    std::string text;
    std::optional<std::string> parse_mode;
    std::optional<std::vector<types::MessageEntity>> entities;
    std::optional<bool> disable_web_page_preview;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
    std::optional<types::ReplyMarkup> reply_markup;
};

struct ForwardMessage {
    types::ChatId chat_id;
    types::ChatId from_chat_id;
    std::optional<bool> disable_notification;
    std::int64_t message_id = 0;
};

/// Like forwardMessage, but the copy does not link back to the source message.
struct CopyMessage {
    types::ChatId chat_id;
    types::ChatId from_chat_id;
    std::int64_t message_id = 0;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
    std::optional<types::ReplyMarkup> reply_markup;
};

struct SendPhoto {
    types::ChatId chat_id;
    types::FileOrPath photo;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
    std::optional<types::ReplyMarkup> reply_markup;
};

struct SendDocument {
    types::ChatId chat_id;
    types::FileOrPath document;
    std::optional<types::FileOrPath> thumb;
    std::optional<std::string> caption;
    std::optional<std::string> parse_mode;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
    std::optional<types::ReplyMarkup> reply_markup;
};

struct SendMediaGroup {
    types::ChatId chat_id;
    std::vector<types::MediaGroupItem> media;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
};

struct SendLocation {
    types::ChatId chat_id;
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<std::int64_t> live_period;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
    std::optional<types::ReplyMarkup> reply_markup;
};

/// Either chat_id with message_id, or inline_message_id, identifies the
/// message to edit.
struct EditMessageMedia {
    std::optional<types::ChatId> chat_id;
    std::optional<std::int64_t> message_id;
    std::optional<std::string> inline_message_id;
    types::InputMedia media;
    std::optional<types::InlineKeyboardMarkup> reply_markup;
};

struct AnswerCallbackQuery {
    std::string callback_query_id;
    std::optional<std::string> text;
    std::optional<bool> show_alert;
    std::optional<std::string> url;
    std::optional<std::int64_t> cache_time;
};

struct SetMyCommands {
    std::vector<types::BotCommand> commands;
};

struct AnswerInlineQuery {
    std::string inline_query_id;
    std::vector<types::InlineQueryResult> results;
    std::optional<std::int64_t> cache_time;
    std::optional<bool> is_personal;
    std::optional<std::string> next_offset;
    std::optional<std::string> switch_pm_text;
    std::optional<std::string> switch_pm_parameter;
};

struct SetPassportDataErrors {
    std::int64_t user_id = 0;
    std::vector<types::PassportElementError> errors;
};

struct SendInvoice {
    std::int64_t chat_id = 0;
    std::string title;
    std::string description;
    std::string payload;
    std::string provider_token;
    std::string start_parameter;
    std::string currency;
    std::vector<types::LabeledPrice> prices;
    std::optional<std::string> provider_data;
    std::optional<std::string> photo_url;
    std::optional<std::int64_t> photo_size;
    std::optional<std::int64_t> photo_width;
    std::optional<std::int64_t> photo_height;
    std::optional<bool> need_name;
    std::optional<bool> need_phone_number;
    std::optional<bool> need_email;
    std::optional<bool> need_shipping_address;
    std::optional<bool> send_phone_number_to_provider;
    std::optional<bool> send_email_to_provider;
    std::optional<bool> is_flexible;
    std::optional<bool> disable_notification;
    std::optional<std::int64_t> reply_to_message_id;
    std::optional<types::InlineKeyboardMarkup> reply_markup;
};

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

auto get_updates(const GetUpdates& p = {}) -> request::OutgoingRequest;
auto get_me() -> request::OutgoingRequest;
auto send_message(const SendMessage& p) -> request::OutgoingRequest;
auto forward_message(const ForwardMessage& p) -> request::OutgoingRequest;
auto copy_message(const CopyMessage& p) -> request::OutgoingRequest;
auto send_photo(const SendPhoto& p) -> request::OutgoingRequest;
auto send_document(const SendDocument& p) -> request::OutgoingRequest;
auto send_media_group(const SendMediaGroup& p) -> request::OutgoingRequest;
auto send_location(const SendLocation& p) -> request::OutgoingRequest;
auto edit_message_media(const EditMessageMedia& p) -> request::OutgoingRequest;
auto answer_callback_query(const AnswerCallbackQuery& p) -> request::OutgoingRequest;
auto set_my_commands(const SetMyCommands& p) -> request::OutgoingRequest;
auto answer_inline_query(const AnswerInlineQuery& p) -> request::OutgoingRequest;
auto set_passport_data_errors(const SetPassportDataErrors& p) -> request::OutgoingRequest;
auto send_invoice(const SendInvoice& p) -> request::OutgoingRequest;

} // namespace tgwire::methods
