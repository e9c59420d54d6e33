#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "tgwire/request/methods.hpp"

using json = nlohmann::json;
namespace methods = tgwire::methods;
namespace types = tgwire::types;

namespace {

auto body_of(const tgwire::request::OutgoingRequest& req) -> json {
    return json::parse(req.body());
}

} // namespace

TEST_CASE("send_message", "[methods]") {
    SECTION("required parameters only") {
        auto req = methods::send_message({.chat_id = 42, .text = "hi"});
        CHECK(req.method() == "sendMessage");
        CHECK(req.body() == R"({"chat_id":42,"text":"hi"})");
    }

    SECTION("channel username and inline keyboard") {
        auto req = methods::send_message({
            .chat_id = "@news",
            .text = "Vote",
            .disable_notification = false,
            .reply_markup = types::InlineKeyboardMarkup{
                .inline_keyboard = {{{.text = "Up", .callback_data = "up"}}},
            },
        });
        auto body = body_of(req);
        CHECK(body["chat_id"] == "@news");
        CHECK(body["disable_notification"] == false);
        CHECK(body["reply_markup"] == json::parse(
            R"({"inline_keyboard": [[{"text": "Up", "callback_data": "up"}]]})"));
        CHECK_FALSE(body.contains("parse_mode"));
    }
}

TEST_CASE("get_me and get_updates", "[methods]") {
    auto me = methods::get_me();
    CHECK(me.method() == "getMe");
    CHECK(me.body() == "{}");

    CHECK(methods::get_updates().body() == "{}");

    auto updates = methods::get_updates({.offset = 0, .allowed_updates = std::vector<std::string>{"message"}});
    CHECK(updates.method() == "getUpdates");
    CHECK(body_of(updates) == json::parse(R"({"offset": 0, "allowed_updates": ["message"]})"));
}

TEST_CASE("forward_message and copy_message", "[methods]") {
    auto forward = methods::forward_message({.chat_id = 1, .from_chat_id = "@src", .message_id = 0});
    CHECK(body_of(forward) == json::parse(R"({"chat_id": 1, "from_chat_id": "@src", "message_id": 0})"));

    auto copy = methods::copy_message({.chat_id = 1, .from_chat_id = 2, .message_id = 3,
                                       .caption = "again"});
    CHECK(copy.method() == "copyMessage");
    CHECK(body_of(copy)["caption"] == "again");
}

TEST_CASE("file parameters", "[methods]") {
    auto photo = methods::send_photo({.chat_id = 5, .photo = "AgADBAAD"});
    CHECK(body_of(photo)["photo"] == "AgADBAAD");

    auto document = methods::send_document({
        .chat_id = 5,
        .document = types::InputFile{},
        .thumb = types::FileOrPath{"attach://thumb"},
    });
    auto body = body_of(document);
    CHECK(body["document"] == json::object());
    CHECK(body["thumb"] == "attach://thumb");
}

TEST_CASE("send_media_group", "[methods]") {
    auto req = methods::send_media_group({
        .chat_id = 7,
        .media = {
            types::InputMediaPhoto{.media = "p1", .caption = "first"},
            types::InputMediaVideo{.media = "v1", .duration = 10},
        },
    });
    auto body = body_of(req);
    REQUIRE(body["media"].size() == 2);
    CHECK(body["media"][0] == json::parse(R"({"type": "photo", "media": "p1", "caption": "first"})"));
    CHECK(body["media"][1]["type"] == "video");
    CHECK(body["media"][1]["duration"] == 10);
}

TEST_CASE("send_location", "[methods]") {
    auto req = methods::send_location({.chat_id = 1, .latitude = 52.5, .longitude = 13.25,
                                       .live_period = 60});
    auto body = body_of(req);
    CHECK(body["latitude"] == 52.5);
    CHECK(body["longitude"] == 13.25);
    CHECK(body["live_period"] == 60);
}

TEST_CASE("edit_message_media", "[methods]") {
    auto req = methods::edit_message_media({
        .inline_message_id = "abc",
        .media = types::InputMediaAnimation{.media = "attach://a", .width = 320},
    });
    auto body = body_of(req);
    CHECK(req.method() == "editMessageMedia");
    CHECK_FALSE(body.contains("chat_id"));
    CHECK(body["media"]["type"] == "animation");
    CHECK(body["media"]["width"] == 320);
}

TEST_CASE("answer_callback_query and set_my_commands", "[methods]") {
    auto answer = methods::answer_callback_query({.callback_query_id = "q1", .show_alert = true});
    CHECK(answer.body() == R"({"callback_query_id":"q1","show_alert":true})");

    auto commands = methods::set_my_commands({.commands = {{"start", "Start the bot"}, {"help", "Help"}}});
    CHECK(body_of(commands)["commands"][1] == json{{"command", "help"}, {"description", "Help"}});
}

TEST_CASE("answer_inline_query", "[methods]") {
    auto req = methods::answer_inline_query({
        .inline_query_id = "iq",
        .results = {
            types::InlineQueryResultArticle{
                .id = "1",
                .title = "Hello",
                .input_message_content = types::InputTextMessageContent{.message_text = "Hello!"},
            },
            types::InlineQueryResultGame{.id = "2", .game_short_name = "snake"},
        },
        .cache_time = 0,
    });
    auto body = body_of(req);
    REQUIRE(body["results"].size() == 2);
    CHECK(body["results"][0]["type"] == "article");
    CHECK(body["results"][0]["input_message_content"] == json{{"message_text", "Hello!"}});
    CHECK(body["results"][1] == json::parse(R"({"type": "game", "id": "2", "game_short_name": "snake"})"));
    CHECK(body["cache_time"] == 0);
}

TEST_CASE("set_passport_data_errors", "[methods]") {
    auto req = methods::set_passport_data_errors({
        .user_id = 99,
        .errors = {
            types::PassportElementErrorDataField{.type = "passport", .field_name = "name",
                                                 .data_hash = "h", .message = "wrong"},
            types::PassportElementErrorFiles{.type = "utility_bill", .file_hashes = {"a", "b"},
                                             .message = "blurry"},
        },
    });
    auto body = body_of(req);
    CHECK(body["user_id"] == 99);
    CHECK(body["errors"][0]["source"] == "data");
    CHECK(body["errors"][1]["file_hashes"] == json::array({"a", "b"}));
}

TEST_CASE("send_invoice", "[methods]") {
    auto req = methods::send_invoice({
        .chat_id = 10,
        .title = "Coffee",
        .description = "A cup",
        .payload = "order-1",
        .provider_token = "prov",
        .start_parameter = "buy",
        .currency = "EUR",
        .prices = {{.label = "Cup", .amount = 250}},
        .need_email = true,
    });
    auto body = body_of(req);
    CHECK(req.method() == "sendInvoice");
    CHECK(body["prices"] == json::parse(R"([{"label": "Cup", "amount": 250}])"));
    CHECK(body["need_email"] == true);
    CHECK_FALSE(body.contains("reply_markup"));
}
