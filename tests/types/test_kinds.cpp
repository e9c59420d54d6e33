#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "tgwire/types/kinds.hpp"

using json = nlohmann::json;

TEST_CASE("all_kinds lists every union kind", "[kinds]") {
    const auto& kinds = tgwire::types::all_kinds();
    REQUIRE(kinds.size() == 8);
    CHECK(kinds.front().name == "ChatId");

    for (const auto& kind : kinds) {
        CHECK(kind.candidates.size() >= 2);
        CHECK(static_cast<bool>(kind.decode));
    }
}

TEST_CASE("find_kind", "[kinds]") {
    SECTION("known kind keeps its candidate order") {
        const auto* kind = tgwire::types::find_kind("ReplyMarkup");
        REQUIRE(kind != nullptr);
        REQUIRE(kind->candidates.size() == 4);
        CHECK(kind->candidates[0] == "InlineKeyboardMarkup");
        CHECK(kind->candidates[3] == "ForceReply");
    }

    SECTION("inline query results") {
        const auto* kind = tgwire::types::find_kind("InlineQueryResult");
        REQUIRE(kind != nullptr);
        CHECK(kind->candidates.size() == 20);
        CHECK(kind->candidates[8] == "InlineQueryResultArticle");
    }

    SECTION("unknown kind") {
        CHECK(tgwire::types::find_kind("Nope") == nullptr);
        CHECK(tgwire::types::find_kind("chatid") == nullptr);
    }
}

TEST_CASE("KindInfo::decode resolves by name", "[kinds]") {
    const auto* kind = tgwire::types::find_kind("ChatId");
    REQUIRE(kind != nullptr);

    SECTION("success") {
        auto resolved = kind->decode(json("@news"));
        REQUIRE(resolved.has_value());
        CHECK(resolved->index == 1);
        CHECK(resolved->alternative == "string");
        CHECK(resolved->value == json("@news"));
    }

    SECTION("failure") {
        auto resolved = kind->decode(json::array());
        REQUIRE_FALSE(resolved.has_value());
        CHECK(resolved.error().code() == tgwire::ErrorCode::KindNotRecognized);
        CHECK(resolved.error().detail() == "[]");
    }

    SECTION("re-encoded value drops unknown keys") {
        const auto* markup = tgwire::types::find_kind("ReplyMarkup");
        REQUIRE(markup != nullptr);
        auto resolved = markup->decode(json::parse(R"({"force_reply": true, "extra": 1})"));
        REQUIRE(resolved.has_value());
        CHECK(resolved->alternative == "ForceReply");
        CHECK(resolved->value == json{{"force_reply", true}});
    }
}
