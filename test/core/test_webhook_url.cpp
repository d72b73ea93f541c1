#include <catch2/catch_test_macros.hpp>

#include <discord_mcp/core/webhook_url.hpp>

using namespace discord_mcp;

namespace {

constexpr const char* kDiscordHook =
    "https://discord.com/api/webhooks/1234567890/secret-token_ABC";

} // anonymous namespace

// ===========================================================================
// Create: accepted forms
// ===========================================================================

TEST_CASE("WebhookUrl: Discord webhook URL is split into base and path", "[core][webhook_url]") {
    auto url = WebhookUrl::Create(kDiscordHook);
    REQUIRE(url.IsOk());
    CHECK(url.Value().Value() == kDiscordHook);
    CHECK(url.Value().IsHttps());
    CHECK(url.Value().BaseUrl() == "https://discord.com");
    CHECK(url.Value().Path() == "/api/webhooks/1234567890/secret-token_ABC");
}

TEST_CASE("WebhookUrl: explicit port stays in the base URL", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("http://127.0.0.1:8080/hook");
    REQUIRE(url.IsOk());
    CHECK_FALSE(url.Value().IsHttps());
    CHECK(url.Value().BaseUrl() == "http://127.0.0.1:8080");
    CHECK(url.Value().Path() == "/hook");
}

TEST_CASE("WebhookUrl: query is kept in the request path", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("https://discord.com/api/webhooks/1/tok?wait=true");
    REQUIRE(url.IsOk());
    CHECK(url.Value().Path() == "/api/webhooks/1/tok?wait=true");
}

TEST_CASE("WebhookUrl: slash inside a query without a path", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("https://discord.com?a=/b");
    REQUIRE(url.IsOk());
    CHECK(url.Value().BaseUrl() == "https://discord.com");
    CHECK(url.Value().Path() == "/?a=/b");
    CHECK(url.Value().Redacted() == "https://discord.com/");
}

TEST_CASE("WebhookUrl: query without a path", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("http://localhost:9000?wait=true");
    REQUIRE(url.IsOk());
    CHECK(url.Value().BaseUrl() == "http://localhost:9000");
    CHECK(url.Value().Path() == "/?wait=true");
}

TEST_CASE("WebhookUrl: missing path defaults to /", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("http://localhost:9000");
    REQUIRE(url.IsOk());
    CHECK(url.Value().Path() == "/");
}

// ===========================================================================
// Create: rejected forms
// ===========================================================================

TEST_CASE("WebhookUrl: empty is rejected", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("");
    REQUIRE(url.IsErr());
    CHECK(url.Error().find("empty") != std::string::npos);
}

TEST_CASE("WebhookUrl: unsupported scheme is rejected", "[core][webhook_url]") {
    CHECK(WebhookUrl::Create("ftp://discord.com/hook").IsErr());
    CHECK(WebhookUrl::Create("discord.com/api/webhooks/1/t").IsErr());
}

TEST_CASE("WebhookUrl: whitespace is rejected", "[core][webhook_url]") {
    CHECK(WebhookUrl::Create("https://discord.com/api/webhooks/1/t ").IsErr());
    CHECK(WebhookUrl::Create(" https://discord.com/").IsErr());
}

TEST_CASE("WebhookUrl: missing host is rejected", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("https:///api/webhooks/1/t");
    REQUIRE(url.IsErr());
    CHECK(url.Error().find("host") != std::string::npos);
}

TEST_CASE("WebhookUrl: user information is rejected", "[core][webhook_url]") {
    CHECK(WebhookUrl::Create("https://user:pw@discord.com/hook").IsErr());
}

// ===========================================================================
// Redacted
// ===========================================================================

TEST_CASE("WebhookUrl: Redacted hides the token segment", "[core][webhook_url]") {
    auto url = WebhookUrl::Create(kDiscordHook).Value();
    auto redacted = url.Redacted();
    CHECK(redacted == "https://discord.com/api/webhooks/1234567890/***");
    CHECK(redacted.find("secret-token") == std::string::npos);
}

TEST_CASE("WebhookUrl: Redacted drops the query", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("https://discord.com/api/webhooks/1/tok?wait=true").Value();
    CHECK(url.Redacted() == "https://discord.com/api/webhooks/1/***");
}

TEST_CASE("WebhookUrl: Redacted root path has nothing to hide", "[core][webhook_url]") {
    auto url = WebhookUrl::Create("http://localhost:9000").Value();
    CHECK(url.Redacted() == "http://localhost:9000/");
}

TEST_CASE("WebhookUrl: equality compares the full URL", "[core][webhook_url]") {
    auto a = WebhookUrl::Create(kDiscordHook).Value();
    auto b = WebhookUrl::Create(kDiscordHook).Value();
    auto c = WebhookUrl::Create("https://discord.com/api/webhooks/1/other").Value();
    CHECK(a == b);
    CHECK(a != c);
}
