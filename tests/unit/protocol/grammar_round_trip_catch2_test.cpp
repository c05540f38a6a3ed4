// Catch2 tests: every constructible command survives encode followed by decode at each layer

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include <editrpc/protocol/message_decoder.h>

using namespace editrpc;
using namespace editrpc::protocol;
using json = nlohmann::json;

namespace {

const ViewIdentifier kView{"view-id-1"};

constexpr DecodeStrategy kStrategies[] = {DecodeStrategy::Borrowed, DecodeStrategy::Owned,
                                          DecodeStrategy::Tagged};

std::vector<EditNotification> payloadEditNotifications() {
    return {
        EditNotification::insert("hello\n\"world\""),
        EditNotification::insert(""),
        EditNotification::scroll(LineRange{3, 13}),
        EditNotification::requestLines(LineRange{0, 0}),
        EditNotification::click(MouseAction{3, 10, 0, 1}),
        EditNotification::click(MouseAction{3, 10, 4, std::nullopt}),
        EditNotification::drag(MouseAction{5, 34, 0, std::nullopt}),
        EditNotification::drag(MouseAction{5, 34, 2, 3}),
        EditNotification::gotoLine(42),
        EditNotification::gesture(2, 7, GestureType::ToggleSel),
        EditNotification::findNext(true, false),
        EditNotification::findNext(false, true),
        EditNotification::findPrevious(true),
    };
}

std::vector<EditNotification> allEditNotifications() {
    std::vector<EditNotification> out;
    for (std::size_t i = 0; i < kEditNotificationMethodCount; ++i) {
        auto method = static_cast<EditNotificationMethod>(i);
        if (isUnitMethod(method)) {
            out.push_back(EditNotification::command(method));
        }
    }
    for (auto& cmd : payloadEditNotifications()) {
        out.push_back(std::move(cmd));
    }
    return out;
}

std::vector<PluginNotification> allPluginNotifications() {
    return {
        PluginNotification{PluginStart{kView, "syntect"}},
        PluginNotification{PluginStop{kView, "syntect"}},
        PluginNotification{PluginRpc{
            kView, "syntect",
            PlaceholderRpc{"reindex", json::parse(R"({"full":true})"), RpcType::Notification}}},
        PluginNotification{PluginRpc{
            kView, "lint", PlaceholderRpc{"diagnostics", json::parse("[1,[2,3]]"), RpcType::Request}}},
        PluginNotification{
            PluginRpc{kView, "lint", PlaceholderRpc{"ping", nullptr, RpcType::Notification}}},
    };
}

std::vector<CoreNotification> allCoreNotifications() {
    std::vector<CoreNotification> out;
    for (auto& edit : allEditNotifications()) {
        out.emplace_back(EditNotificationCommand{kView, std::move(edit)});
    }
    for (auto& plugin : allPluginNotifications()) {
        out.emplace_back(std::move(plugin));
    }
    out.emplace_back(CloseView{kView});
    out.emplace_back(Save{kView, "/tmp/notes.md"});
    out.emplace_back(SetTheme{"InspiredGitHub"});
    out.emplace_back(ClientStarted{});
    return out;
}

std::vector<CoreRequest> allCoreRequests() {
    return {
        CoreRequest{EditRequestCommand{kView, EditRequest::cut()}},
        CoreRequest{EditRequestCommand{kView, EditRequest::copy()}},
        CoreRequest{EditRequestCommand{kView, EditRequest::find("needle", true)}},
        CoreRequest{EditRequestCommand{kView, EditRequest::find(std::nullopt, false)}},
        CoreRequest{NewView{}},
        CoreRequest{NewView{"/tmp/notes.md"}},
    };
}

} // namespace

TEST_CASE("Every edit notification round-trips", "[protocol][roundtrip][catch2]") {
    const auto commands = allEditNotifications();
    CHECK(commands.size() == 43 + payloadEditNotifications().size());

    for (const auto& cmd : commands) {
        const json wire = cmd.toJson();
        INFO(wire.dump());
        auto decoded = EditNotification::fromJson(wire);
        REQUIRE(decoded.has_value());
        CHECK(decoded.value() == cmd);

        const EditNotificationCommand scoped{kView, cmd};
        auto viaView = EditNotificationCommand::fromJson(scoped.toJson());
        REQUIRE(viaView.has_value());
        CHECK(viaView.value() == scoped);
    }
}

TEST_CASE("Every edit request round-trips", "[protocol][roundtrip][catch2]") {
    for (const auto& cmd : {EditRequest::cut(), EditRequest::copy(),
                            EditRequest::find("x", false), EditRequest::find(std::nullopt, true)}) {
        const json wire = cmd.toJson();
        INFO(wire.dump());
        auto decoded = EditRequest::fromJson(wire);
        REQUIRE(decoded.has_value());
        CHECK(decoded.value() == cmd);
    }
}

TEST_CASE("Every plugin notification round-trips", "[protocol][roundtrip][catch2]") {
    for (const auto& plugin : allPluginNotifications()) {
        const json wire = plugin.toJson();
        INFO(wire.dump());
        auto decoded = PluginNotification::fromJson(wire);
        REQUIRE(decoded.has_value());
        CHECK(decoded.value() == plugin);
    }
}

TEST_CASE("Every core notification round-trips", "[protocol][roundtrip][catch2]") {
    for (const auto& value : allCoreNotifications()) {
        const json wire = encode(value);
        INFO(wire.dump());

        auto direct = decodeNotification(wire.at("method").get_ref<const std::string&>(),
                                         wire.at("params"));
        REQUIRE(direct.has_value());
        CHECK(direct.value() == value);

        auto envelope = decodeNotificationEnvelope(wire);
        REQUIRE(envelope.has_value());
        CHECK(envelope.value() == value);

        const IncomingMessage message{IncomingNotification{value}};
        const std::string line = encodeMessage(message).dump();
        for (auto strategy : kStrategies) {
            INFO("strategy " << toString(strategy));
            auto decoded = decodeMessage(line, strategy);
            REQUIRE(decoded.has_value());
            CHECK(decoded.value() == message);
        }
    }
}

TEST_CASE("Every core request round-trips with its id", "[protocol][roundtrip][catch2]") {
    const json ids[] = {json(0), json(9007199254740993ULL), json("req-7"), json(nullptr),
                        json::parse(R"({"seq":[1,2]})")};

    for (const auto& value : allCoreRequests()) {
        const json wire = encode(value);
        INFO(wire.dump());

        auto direct =
            decodeRequest(wire.at("method").get_ref<const std::string&>(), wire.at("params"));
        REQUIRE(direct.has_value());
        CHECK(direct.value() == value);

        for (const auto& id : ids) {
            const IncomingMessage message{IncomingRequest{id, value}};
            const std::string line = encodeMessage(message).dump();
            INFO(line);
            for (auto strategy : kStrategies) {
                INFO("strategy " << toString(strategy));
                auto decoded = decodeMessage(line, strategy);
                REQUIRE(decoded.has_value());
                CHECK(decoded.value() == message);
                CHECK(rpcType(decoded.value()) == RpcType::Request);
            }
        }
    }
}
