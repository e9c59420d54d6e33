#include "tgwire/request/methods.hpp"

namespace tgwire::methods {

using request::assemble;
using request::OutgoingRequest;
using request::ParameterMap;

auto get_updates(const GetUpdates& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("offset", p.offset)
          .set("limit", p.limit)
          .set("timeout", p.timeout)
          .set("allowed_updates", p.allowed_updates);
    return assemble("getUpdates", params);
}

auto get_me() -> OutgoingRequest {
    return assemble("getMe", ParameterMap{});
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

auto send_message(const SendMessage& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("text", p.text)
          .set("parse_mode", p.parse_mode)
          .set("entities", p.entities)
          .set("disable_web_page_preview", p.disable_web_page_preview)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id)
          .set("reply_markup", p.reply_markup);
    return assemble("sendMessage", params);
}

auto forward_message(const ForwardMessage& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("from_chat_id", p.from_chat_id)
          .set("disable_notification", p.disable_notification)
          .set("message_id", p.message_id);
    return assemble("forwardMessage", params);
}

auto copy_message(const CopyMessage& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("from_chat_id", p.from_chat_id)
          .set("message_id", p.message_id)
          .set("caption", p.caption)
          .set("parse_mode", p.parse_mode)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id)
          .set("reply_markup", p.reply_markup);
    return assemble("copyMessage", params);
}

auto send_photo(const SendPhoto& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("photo", p.photo)
          .set("caption", p.caption)
          .set("parse_mode", p.parse_mode)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id)
          .set("reply_markup", p.reply_markup);
    return assemble("sendPhoto", params);
}

auto send_document(const SendDocument& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("document", p.document)
          .set("thumb", p.thumb)
          .set("caption", p.caption)
          .set("parse_mode", p.parse_mode)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id)
          .set("reply_markup", p.reply_markup);
    return assemble("sendDocument", params);
}

auto send_media_group(const SendMediaGroup& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("media", p.media)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id);
    return assemble("sendMediaGroup", params);
}

auto send_location(const SendLocation& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("latitude", p.latitude)
          .set("longitude", p.longitude)
          .set("live_period", p.live_period)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id)
          .set("reply_markup", p.reply_markup);
    return assemble("sendLocation", params);
}

auto edit_message_media(const EditMessageMedia& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("message_id", p.message_id)
          .set("inline_message_id", p.inline_message_id)
          .set("media", p.media)
          .set("reply_markup", p.reply_markup);
    return assemble("editMessageMedia", params);
}

// ---------------------------------------------------------------------------
// Callback and inline queries
// ---------------------------------------------------------------------------

auto answer_callback_query(const AnswerCallbackQuery& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("callback_query_id", p.callback_query_id)
          .set("text", p.text)
          .set("show_alert", p.show_alert)
          .set("url", p.url)
          .set("cache_time", p.cache_time);
    return assemble("answerCallbackQuery", params);
}

auto set_my_commands(const SetMyCommands& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("commands", p.commands);
    return assemble("setMyCommands", params);
}

auto answer_inline_query(const AnswerInlineQuery& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("inline_query_id", p.inline_query_id)
          .set("results", p.results)
          .set("cache_time", p.cache_time)
          .set("is_personal", p.is_personal)
          .set("next_offset", p.next_offset)
          .set("switch_pm_text", p.switch_pm_text)
          .set("switch_pm_parameter", p.switch_pm_parameter);
    return assemble("answerInlineQuery", params);
}

// ---------------------------------------------------------------------------
// Passport and payments
// ---------------------------------------------------------------------------

auto set_passport_data_errors(const SetPassportDataErrors& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("user_id", p.user_id)
          .set("errors", p.errors);
    return assemble("setPassportDataErrors", params);
}

auto send_invoice(const SendInvoice& p) -> OutgoingRequest {
    ParameterMap params;
    params.set("chat_id", p.chat_id)
          .set("title", p.title)
          .set("description", p.description)
          .set("payload", p.payload)
          .set("provider_token", p.provider_token)
          .set("start_parameter", p.start_parameter)
          .set("currency", p.currency)
          .set("prices", p.prices)
          .set("provider_data", p.provider_data)
          .set("photo_url", p.photo_url)
          .set("photo_size", p.photo_size)
          .set("photo_width", p.photo_width)
          .set("photo_height", p.photo_height)
          .set("need_name", p.need_name)
          .set("need_phone_number", p.need_phone_number)
          .set("need_email", p.need_email)
          .set("need_shipping_address", p.need_shipping_address)
          .set("send_phone_number_to_provider", p.send_phone_number_to_provider)
          .set("send_email_to_provider", p.send_email_to_provider)
          .set("is_flexible", p.is_flexible)
          .set("disable_notification", p.disable_notification)
          .set("reply_to_message_id", p.reply_to_message_id)
          .set("reply_markup", p.reply_markup);
    return assemble("sendInvoice", params);
}

} // namespace tgwire::methods
