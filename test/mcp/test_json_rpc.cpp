#include <catch2/catch_test_macros.hpp>

#include <bullvision/mcp/json_rpc.hpp>

#include <string>

using namespace bullvision;
using namespace bullvision::rpc;

// ===========================================================================
// Builders
// ===========================================================================

TEST_CASE("MakeRequest: carries id, method and params", "[rpc]") {
    auto req = MakeRequest(7, "tools/list", {{"cursor", "abc"}});
    CHECK(req["jsonrpc"] == "2.0");
    CHECK(req["id"] == 7);
    CHECK(req["method"] == "tools/list");
    CHECK(req["params"]["cursor"] == "abc");
}

TEST_CASE("MakeRequest: null params are omitted", "[rpc]") {
    auto req = MakeRequest(1, "ping", nullptr);
    CHECK_FALSE(req.contains("params"));
}

TEST_CASE("MakeNotification: has no id", "[rpc]") {
    auto n = MakeNotification("notifications/initialized");
    CHECK(n["method"] == "notifications/initialized");
    CHECK_FALSE(n.contains("id"));
    CHECK_FALSE(n.contains("params"));
}

TEST_CASE("Serialize: single line", "[rpc]") {
    auto line = Serialize(MakeRequest(1, "tools/call", {{"name", "a\nb"}}));
    CHECK(line.find('\n') == std::string::npos);
}

// ===========================================================================
// ParseMessage: classification
// ===========================================================================

TEST_CASE("ParseMessage: request", "[rpc]") {
    auto r = ParseMessage(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().kind == MessageKind::Request);
    CHECK(r.Value().id == 3);
    CHECK(r.Value().method == "ping");
    CHECK(r.Value().params.is_null());
}

TEST_CASE("ParseMessage: notification", "[rpc]") {
    auto r = ParseMessage(
        R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().kind == MessageKind::Notification);
    CHECK(r.Value().method == "notifications/tools/list_changed");
}

TEST_CASE("ParseMessage: result response", "[rpc]") {
    auto r = ParseMessage(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().kind == MessageKind::Response);
    CHECK_FALSE(r.Value().IsErrorResponse());
    CHECK(r.Value().result["tools"].is_array());
}

TEST_CASE("ParseMessage: error response", "[rpc]") {
    auto r = ParseMessage(
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32602,"message":"bad","data":{"x":1}}})");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().IsErrorResponse());
    CHECK(r.Value().error->code == kInvalidParams);
    CHECK(r.Value().error->message == "bad");
    CHECK(r.Value().error->data["x"] == 1);
}

// ===========================================================================
// ParseMessage: malformed input
// ===========================================================================

TEST_CASE("ParseMessage: malformed lines are protocol errors", "[rpc]") {
    SECTION("not JSON") {
        auto r = ParseMessage("Starting server...");
        REQUIRE(r.IsErr());
        CHECK(r.Error().Is(ErrorCategory::Protocol));
    }
    SECTION("not an object") {
        CHECK(ParseMessage("[1,2]").IsErr());
    }
    SECTION("wrong version") {
        CHECK(ParseMessage(R"({"jsonrpc":"1.0","id":1,"result":{}})").IsErr());
    }
    SECTION("missing version") {
        CHECK(ParseMessage(R"({"id":1,"result":{}})").IsErr());
    }
    SECTION("response with both result and error") {
        CHECK(ParseMessage(
            R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})").IsErr());
    }
    SECTION("response with neither result nor error") {
        CHECK(ParseMessage(R"({"jsonrpc":"2.0","id":1})").IsErr());
    }
    SECTION("error without integer code") {
        CHECK(ParseMessage(R"({"jsonrpc":"2.0","id":1,"error":{"message":"x"}})").IsErr());
    }
    SECTION("non-string method") {
        CHECK(ParseMessage(R"({"jsonrpc":"2.0","id":1,"method":5})").IsErr());
    }
    SECTION("no id, no method") {
        CHECK(ParseMessage(R"({"jsonrpc":"2.0","result":{}})").IsErr());
    }
}
