#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "tgwire/codec/wire.hpp"
#include "tgwire/types/common.hpp"
#include "tgwire/types/inline_query.hpp"
#include "tgwire/types/keyboard.hpp"

using json = nlohmann::json;

TEST_CASE("records encode through their wire table", "[wire]") {
    tgwire::types::User user{.id = 7, .is_bot = true, .first_name = "Bot"};
    json j = user;

    CHECK(j == json{{"id", 7}, {"is_bot", true}, {"first_name", "Bot"}});

    SECTION("empty optionals are omitted") {
        CHECK_FALSE(j.contains("last_name"));
        CHECK_FALSE(j.contains("username"));
    }

    SECTION("present optionals are written") {
        user.username = "the_bot";
        json k = user;
        CHECK(k["username"] == "the_bot");
    }
}

TEST_CASE("records decode strictly", "[wire]") {
    using tgwire::codec::decode_record;
    using tgwire::types::User;

    SECTION("valid object") {
        auto user = decode_record<User>(json::parse(
            R"({"id": 1, "is_bot": false, "first_name": "Ann", "language_code": "en"})"));
        REQUIRE(user.has_value());
        CHECK(user->id == 1);
        CHECK(user->first_name == "Ann");
        CHECK(user->language_code == "en");
        CHECK_FALSE(user->last_name.has_value());
    }

    SECTION("unknown keys are ignored") {
        auto user = decode_record<User>(json::parse(
            R"({"id": 1, "is_bot": false, "first_name": "Ann", "is_premium": true})"));
        CHECK(user.has_value());
    }

    SECTION("explicit null for an optional member") {
        auto user = decode_record<User>(json::parse(
            R"({"id": 1, "is_bot": false, "first_name": "Ann", "username": null})"));
        REQUIRE(user.has_value());
        CHECK_FALSE(user->username.has_value());
    }

    SECTION("missing required key") {
        auto user = decode_record<User>(json::parse(R"({"id": 1, "first_name": "Ann"})"));
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error().code() == tgwire::ErrorCode::SerializationError);
        CHECK(user.error().message() == "Missing required field 'is_bot'");
    }

    SECTION("integer field given a string") {
        auto user = decode_record<User>(json::parse(
            R"({"id": "1", "is_bot": false, "first_name": "Ann"})"));
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error().message() == "Expected integer, got string");
    }

    SECTION("optional field with the wrong type") {
        auto user = decode_record<User>(json::parse(
            R"({"id": 1, "is_bot": false, "first_name": "Ann", "username": 5})"));
        CHECK_FALSE(user.has_value());
    }

    SECTION("not an object") {
        auto user = decode_record<User>(json::array());
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error().message() == "Expected object, got array");
    }
}

TEST_CASE("decode_value JSON type rules", "[wire]") {
    using tgwire::codec::decode_value;

    CHECK(decode_value<bool>(json(true)) == true);
    CHECK_THROWS_AS(decode_value<bool>(json(1)), tgwire::DecodeError);
    CHECK_THROWS_AS(decode_value<std::int64_t>(json(1.5)), tgwire::DecodeError);
    CHECK_THROWS_AS(decode_value<std::string>(json(3)), tgwire::DecodeError);

    SECTION("floating point accepts integers") {
        CHECK(decode_value<double>(json(3)) == 3.0);
        CHECK(decode_value<double>(json(2.5)) == 2.5);
        CHECK_THROWS_AS(decode_value<double>(json("2.5")), tgwire::DecodeError);
    }

    SECTION("sequences decode element-wise") {
        auto v = decode_value<std::vector<std::string>>(json::parse(R"(["a", "b"])"));
        CHECK(v == std::vector<std::string>{"a", "b"});
        CHECK_THROWS_AS(decode_value<std::vector<std::string>>(json::parse(R"(["a", 1])")),
                        tgwire::DecodeError);
    }
}

TEST_CASE("nested records and row layouts", "[wire]") {
    SECTION("entity with a user") {
        auto j = json::parse(R"({"type": "text_mention", "offset": 0, "length": 3,
                                 "user": {"id": 9, "is_bot": false, "first_name": "Zed"}})");
        auto entity = j.get<tgwire::types::MessageEntity>();
        REQUIRE(entity.user.has_value());
        CHECK(entity.user->id == 9);

        json back = entity;
        CHECK(back == j);
    }

    SECTION("inline keyboard keeps its rows") {
        tgwire::types::InlineKeyboardMarkup markup{
            .inline_keyboard = {
                {{.text = "A", .callback_data = "a"}, {.text = "B", .url = "https://x.y"}},
                {{.text = "C", .pay = true}},
            },
        };
        json j = markup;
        REQUIRE(j["inline_keyboard"].size() == 2);
        CHECK(j["inline_keyboard"][0].size() == 2);
        CHECK(j["inline_keyboard"][1][0]["pay"] == true);
        CHECK(j.get<tgwire::types::InlineKeyboardMarkup>() == markup);
    }

    SECTION("callback game is an empty object") {
        tgwire::types::InlineKeyboardButton button{.text = "Play",
                                                   .callback_game = tgwire::types::CallbackGame{}};
        json j = button;
        CHECK(j["callback_game"] == json::object());
    }
}

TEST_CASE("InputFile is an empty record", "[wire]") {
    json j = tgwire::types::InputFile{};
    CHECK(j == json::object());

    CHECK(tgwire::codec::decode_record<tgwire::types::InputFile>(
              json::parse(R"({"attach": "file0"})")).has_value());
    CHECK_FALSE(tgwire::codec::decode_record<tgwire::types::InputFile>(json("file0")).has_value());
}

TEST_CASE("coordinates accept any JSON number", "[wire]") {
    auto content = tgwire::codec::decode_record<tgwire::types::InputLocationMessageContent>(
        json::parse(R"({"latitude": 52, "longitude": 13.4})"));
    REQUIRE(content.has_value());
    CHECK(content->latitude == 52.0);
    CHECK(content->longitude == 13.4);
}
