#include <catch2/catch_test_macros.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tgwire/cli/app.hpp"

using json = nlohmann::json;

namespace {

/// Runs a fresh App over `args` and captures what it prints to stdout.
struct Invocation {
    int exit_code = 0;
    std::string out;
};

auto invoke(std::vector<std::string> args) -> Invocation {
    args.insert(args.begin(), "tgwire");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    std::ostringstream captured;
    auto* previous = std::cout.rdbuf(captured.rdbuf());
    std::cerr.setstate(std::ios::failbit);

    tgwire::cli::App app;
    int code = app.run(static_cast<int>(argv.size()), argv.data());

    std::cout.rdbuf(previous);
    std::cerr.clear();
    return {code, captured.str()};
}

} // namespace

TEST_CASE("decode subcommand", "[cli]") {
    SECTION("resolves a ChatId") {
        auto result = invoke({"decode", "ChatId", "42"});
        REQUIRE(result.exit_code == 0);
        auto j = json::parse(result.out);
        CHECK(j["alternative"] == "integer");
        CHECK(j["index"] == 0);
        CHECK(j["value"] == 42);
    }

    SECTION("reports an unrecognized value") {
        CHECK(invoke({"decode", "ChatId", "true"}).exit_code == 1);
    }

    SECTION("rejects an unknown kind") {
        CHECK(invoke({"decode", "Bogus", "1"}).exit_code == 1);
    }

    SECTION("rejects malformed JSON") {
        CHECK(invoke({"decode", "ChatId", "{oops"}).exit_code == 1);
    }
}

TEST_CASE("encode subcommand", "[cli]") {
    SECTION("masks the token by default") {
        auto result = invoke({"encode", "sendMessage", "-t", "123:ABC",
                              "-j", R"({"chat_id": 42, "text": "hi"})"});
        REQUIRE(result.exit_code == 0);
        CHECK(result.out.find("POST https://api.telegram.org/bot<redacted>/sendMessage")
              != std::string::npos);
        CHECK(result.out.find("123:ABC") == std::string::npos);
        CHECK(result.out.find(R"({"chat_id":42,"text":"hi"})") != std::string::npos);
    }

    SECTION("shows the token on request") {
        auto result = invoke({"encode", "getMe", "-t", "123:ABC", "--show-token"});
        REQUIRE(result.exit_code == 0);
        CHECK(result.out.find("bot123:ABC/getMe") != std::string::npos);
        CHECK(result.out.find("{}") != std::string::npos);
    }

    SECTION("invalid endpoint") {
        CHECK(invoke({"encode", "getMe", "-t", "12 34"}).exit_code == 1);
    }

    SECTION("parameters must be an object") {
        CHECK(invoke({"encode", "getMe", "-t", "1:A", "-j", "[1]"}).exit_code == 1);
    }
}

TEST_CASE("kinds subcommand lists candidate order", "[cli]") {
    auto result = invoke({"kinds"});
    REQUIRE(result.exit_code == 0);
    auto pos_kind = result.out.find("ReplyMarkup");
    REQUIRE(pos_kind != std::string::npos);
    CHECK(result.out.find("0. InlineKeyboardMarkup", pos_kind) != std::string::npos);
}

TEST_CASE("a subcommand is required", "[cli]") {
    CHECK(invoke({}).exit_code != 0);
}
