// Catch2 tests for the edit notification and edit request grammars

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include <editrpc/protocol/edit_commands.h>

using namespace editrpc;
using namespace editrpc::protocol;
using json = nlohmann::json;

namespace {

Result<EditNotification> decode(std::string_view method, const char* params) {
    if (params == nullptr) {
        return EditNotification::fromJson(method, nullptr);
    }
    const json p = json::parse(params);
    return EditNotification::fromJson(method, &p);
}

} // namespace

TEST_CASE("Edit method names are unique and parse back", "[protocol][edit][catch2]") {
    for (std::size_t i = 0; i < kEditNotificationMethodCount; ++i) {
        auto method = static_cast<EditNotificationMethod>(i);
        auto name = methodName(method);
        INFO(name);
        REQUIRE_FALSE(name.empty());
        REQUIRE(parseEditNotificationMethod(name) == method);
    }
    CHECK(kEditNotificationMethodCount == 52);
    CHECK_FALSE(parseEditNotificationMethod("Insert").has_value());
    CHECK_FALSE(parseEditNotificationMethod("cut").has_value());
}

TEST_CASE("Unit edit commands decode with or without params", "[protocol][edit][catch2]") {
    SECTION("absent params") {
        auto r = decode("delete_backward", nullptr);
        REQUIRE(r.has_value());
        CHECK(r.value().method() == EditNotificationMethod::DeleteBackward);
        CHECK(std::holds_alternative<std::monostate>(r.value().params()));
    }
    SECTION("null params") {
        auto r = decode("undo", "null");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::command(EditNotificationMethod::Undo));
    }
    SECTION("unexpected payload") {
        auto r = decode("undo", R"({"steps": 2})");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::MalformedEditParams);
        CHECK(r.error().method == "undo");
    }
}

TEST_CASE("Insert requires chars", "[protocol][edit][catch2]") {
    auto r = decode("insert", R"({"chars": "hello"})");
    REQUIRE(r.has_value());
    auto* p = r.value().paramsAs<InsertParams>();
    REQUIRE(p != nullptr);
    CHECK(p->chars == "hello");
    CHECK(r.value().toJson() == json::parse(R"({"method":"insert","params":{"chars":"hello"}})"));

    auto missing = decode("insert", nullptr);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::MalformedEditParams);
    CHECK(missing.error().params.is_null());

    auto wrongType = decode("insert", R"({"chars": 5})");
    REQUIRE_FALSE(wrongType.has_value());
    CHECK(wrongType.error().code == ErrorCode::MalformedEditParams);
    CHECK(wrongType.error().params == json::parse(R"({"chars": 5})"));
}

TEST_CASE("Positional edit payloads", "[protocol][edit][catch2]") {
    SECTION("scroll") {
        auto r = decode("scroll", "[3, 13]");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::scroll(LineRange{3, 13}));
    }
    SECTION("request_lines") {
        auto r = decode("request_lines", "[12, 13]");
        REQUIRE(r.has_value());
        CHECK(r.value().method() == EditNotificationMethod::RequestLines);
        CHECK(*r.value().paramsAs<LineRange>() == LineRange{12, 13});
    }
    SECTION("click with click count") {
        auto r = decode("click", "[3, 10, 0, 1]");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::click(MouseAction{3, 10, 0, 1}));
    }
    SECTION("drag without click count") {
        auto r = decode("drag", "[5, 34, 0]");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::drag(MouseAction{5, 34, 0, std::nullopt}));
        CHECK(r.value().toJson() == json::parse(R"({"method":"drag","params":[5,34,0]})"));
    }
    SECTION("scroll with a mouse action shape") {
        auto r = decode("scroll", "[1, 2, 3]");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::MalformedEditParams);
        CHECK(r.error().method == "scroll");
    }
    SECTION("click with too few elements") {
        auto r = decode("click", "[1, 2]");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::MalformedEditParams);
    }
}

TEST_CASE("Named edit payloads", "[protocol][edit][catch2]") {
    SECTION("goto_line") {
        auto r = decode("goto_line", R"({"line": 1})");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::gotoLine(1));
    }
    SECTION("gesture") {
        auto r = decode("gesture", R"({"line": 2, "column": 4, "ty": "toggle_sel"})");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::gesture(2, 4, GestureType::ToggleSel));

        auto bad = decode("gesture", R"({"line": 2, "column": 4, "ty": "pinch"})");
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == ErrorCode::MalformedEditParams);
    }
    SECTION("find_next") {
        auto r = decode("find_next", R"({"wrap_around": true, "allow_same": false})");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::findNext(true, false));

        auto missing = decode("find_next", R"({"wrap_around": true})");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == ErrorCode::MalformedEditParams);
    }
    SECTION("find_previous") {
        auto r = decode("find_previous", R"({"wrap_around": false})");
        REQUIRE(r.has_value());
        CHECK(r.value() == EditNotification::findPrevious(false));
    }
}

TEST_CASE("Unknown edit method", "[protocol][edit][catch2]") {
    auto r = decode("frobnicate", nullptr);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::UnknownEditMethod);
    CHECK(r.error().method == "frobnicate");
    CHECK(r.error().message() == "Error: Unknown edit method 'frobnicate'");
}

TEST_CASE("Edit notification from envelope", "[protocol][edit][catch2]") {
    auto r = EditNotification::fromJson(json::parse(R"({"method":"goto_line","params":{"line":9}})"));
    REQUIRE(r.has_value());
    CHECK(r.value() == EditNotification::gotoLine(9));

    auto noMethod = EditNotification::fromJson(json::parse(R"({"params":{"line":9}})"));
    REQUIRE_FALSE(noMethod.has_value());
    CHECK(noMethod.error().code == ErrorCode::UnknownEditMethod);
}

TEST_CASE("Unit commands encode without params", "[protocol][edit][catch2]") {
    auto cmd = EditNotification::command(EditNotificationMethod::SelectAll);
    CHECK(cmd.toJson() == json::parse(R"({"method":"select_all"})"));
    CHECK(cmd.name() == "select_all");
}

TEST_CASE("Unit factory rejects payload methods", "[protocol][edit][catch2]") {
    CHECK_THROWS_AS(EditNotification::command(EditNotificationMethod::Insert),
                    std::invalid_argument);
    CHECK_NOTHROW(EditNotification::command(EditNotificationMethod::Yank));
}

TEST_CASE("Mouse factories reject a zero click count", "[protocol][edit][catch2]") {
    CHECK_THROWS_AS(EditNotification::click(MouseAction{1, 2, 0, 0}), std::invalid_argument);
    CHECK_THROWS_AS(EditNotification::drag(MouseAction{1, 2, 0, 0}), std::invalid_argument);
    CHECK_NOTHROW(EditNotification::click(MouseAction{1, 2, 0, 2}));
    CHECK_NOTHROW(EditNotification::drag(MouseAction{1, 2, 0, std::nullopt}));

    // The same value arriving on the wire is rejected by the decoder
    auto decoded = decode("click", "[1, 2, 0, 0]");
    REQUIRE_FALSE(decoded.has_value());
    CHECK(decoded.error().code == ErrorCode::MalformedEditParams);
}

TEST_CASE("Edit requests", "[protocol][edit][catch2]") {
    SECTION("cut and copy take no params") {
        auto cut = EditRequest::fromJson("cut", nullptr);
        REQUIRE(cut.has_value());
        CHECK(cut.value() == EditRequest::cut());

        const json empty = nullptr;
        auto copy = EditRequest::fromJson("copy", &empty);
        REQUIRE(copy.has_value());
        CHECK(copy.value() == EditRequest::copy());
    }
    SECTION("find with chars") {
        const json p = json::parse(R"({"chars": "needle", "case_sensitive": true})");
        auto r = EditRequest::fromJson("find", &p);
        REQUIRE(r.has_value());
        CHECK(r.value() == EditRequest::find("needle", true));
        CHECK(r.value().toJson() == json::parse(
                                        R"({"method":"find","params":{"chars":"needle","case_sensitive":true}})"));
    }
    SECTION("find with null chars") {
        const json p = json::parse(R"({"chars": null, "case_sensitive": false})");
        auto r = EditRequest::fromJson("find", &p);
        REQUIRE(r.has_value());
        auto* params = r.value().paramsAs<FindParams>();
        REQUIRE(params != nullptr);
        CHECK_FALSE(params->chars.has_value());
        CHECK(r.value().toJson()["params"]["chars"].is_null());
    }
    SECTION("find without case_sensitive") {
        const json p = json::parse(R"({"chars": "x"})");
        auto r = EditRequest::fromJson("find", &p);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::MalformedEditParams);
    }
    SECTION("notification names are not requests") {
        auto r = EditRequest::fromJson("insert", nullptr);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::UnknownEditMethod);
    }
}
