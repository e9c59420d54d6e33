#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tgwire/request/params.hpp"
#include "tgwire/types/common.hpp"
#include "tgwire/types/keyboard.hpp"

using json = nlohmann::json;
using tgwire::request::ParameterMap;
using tgwire::request::Value;

TEST_CASE("absent entries are never emitted", "[params]") {
    ParameterMap params;
    params.set("a", 0)
          .set("b", false)
          .set("c", tgwire::request::absent);

    CHECK(params.size() == 2);
    CHECK_FALSE(params.contains("c"));
    CHECK(params.encode() == json{{"a", 0}, {"b", false}});
}

TEST_CASE("falsy values are emitted literally", "[params]") {
    ParameterMap params;
    params.set("zero", 0)
          .set("no", false)
          .set("empty", std::string{})
          .set("nothing", nullptr);

    auto j = params.encode();
    CHECK(j["zero"] == 0);
    CHECK(j["no"] == false);
    CHECK(j["empty"] == "");
    REQUIRE(j.contains("nothing"));
    CHECK(j["nothing"].is_null());
}

TEST_CASE("optionals map onto absence", "[params]") {
    ParameterMap params;
    std::optional<std::int64_t> unset;
    std::optional<std::int64_t> set = 5;
    params.set("unset", unset).set("set", set);

    CHECK_FALSE(params.contains("unset"));
    REQUIRE(params.get("set") != nullptr);
    CHECK(params.get("set")->kind() == Value::Kind::Integer);
}

TEST_CASE("setting an absent value removes the entry", "[params]") {
    ParameterMap params;
    params.set("text", "hello");
    REQUIRE(params.contains("text"));

    params.set("text", tgwire::request::absent);
    CHECK_FALSE(params.contains("text"));
    CHECK(params.empty());

    params.set("text", "again");
    CHECK(params.unset("text"));
    CHECK_FALSE(params.unset("text"));
}

TEST_CASE("value kinds", "[params]") {
    CHECK(Value{}.is_absent());
    CHECK(Value::of(true).kind() == Value::Kind::Boolean);
    CHECK(Value::of(42).kind() == Value::Kind::Integer);
    CHECK(Value::of(2.5).kind() == Value::Kind::Float);
    CHECK(Value::of("text").kind() == Value::Kind::String);
    CHECK(Value::of(std::vector<int>{1, 2}).kind() == Value::Kind::Sequence);
    CHECK(Value::of(tgwire::types::BotCommand{"start", "Start"}).kind() == Value::Kind::Record);
    CHECK(Value::of(tgwire::types::ChatId{1}).kind() == Value::Kind::Variant);
    CHECK(tgwire::request::kind_to_string(Value::Kind::Variant) == "variant");
}

TEST_CASE("nested values encode", "[params]") {
    ParameterMap params;
    params.set("chat_id", tgwire::types::ChatId{"@news"})
          .set("entities", std::vector<tgwire::types::MessageEntity>{
                               {.type = "bold", .offset = 0, .length = 4}})
          .set("reply_markup", tgwire::types::ReplyMarkup{tgwire::types::ForceReply{}})
          .set("ids", std::vector<std::int64_t>{3, 1, 2});

    auto j = params.encode();
    CHECK(j["chat_id"] == "@news");
    CHECK(j["entities"] == json::parse(R"([{"type": "bold", "offset": 0, "length": 4}])"));
    CHECK(j["reply_markup"] == json{{"force_reply", true}});
    CHECK(j["ids"] == json::array({3, 1, 2}));
}

TEST_CASE("programming errors fail fast", "[params]") {
    ParameterMap params;

    SECTION("non-finite floating point") {
        CHECK_THROWS_AS(params.set("lat", std::numeric_limits<double>::quiet_NaN()),
                        std::invalid_argument);
        CHECK_THROWS_AS(Value::floating(std::numeric_limits<double>::infinity()),
                        std::invalid_argument);
    }

    SECTION("empty field name") {
        CHECK_THROWS_AS(params.set("", 1), std::invalid_argument);
    }

    SECTION("absent sequence element") {
        std::vector<std::optional<int>> values{1, std::nullopt};
        CHECK_THROWS_AS(params.set("values", values), std::invalid_argument);
    }

    SECTION("unsigned value beyond the integer range") {
        CHECK_THROWS_AS(Value::of(std::numeric_limits<std::uint64_t>::max()),
                        std::invalid_argument);
    }

    SECTION("encoding an absent value") {
        CHECK_THROWS_AS(Value{}.encode(), std::logic_error);
    }

    CHECK(params.empty());
}

TEST_CASE("ParameterMap::from_json", "[params]") {
    SECTION("object") {
        auto params = ParameterMap::from_json(json::parse(
            R"({"chat_id": 42, "text": "hi", "reply_markup": {"force_reply": true},
                "entities": [], "silent": null})"));
        REQUIRE(params.has_value());
        CHECK(params->size() == 5);
        CHECK(params->get("reply_markup")->kind() == Value::Kind::Record);
        CHECK(params->get("entities")->kind() == Value::Kind::Sequence);
        CHECK(params->get("silent")->kind() == Value::Kind::Null);
        CHECK(params->encode()["reply_markup"] == json{{"force_reply", true}});
    }

    SECTION("not an object") {
        auto params = ParameterMap::from_json(json::array());
        REQUIRE_FALSE(params.has_value());
        CHECK(params.error().code() == tgwire::ErrorCode::InvalidArgument);
    }
}
