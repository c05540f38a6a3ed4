#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <editrpc/core/types.h>
#include <editrpc/protocol/view_identifier.h>

namespace editrpc::protocol {

using json = nlohmann::json;

enum class RpcType { Notification, Request };

std::optional<RpcType> rpcTypeFromString(std::string_view name);
std::string_view toString(RpcType type);

/**
 * @brief Generic RPC whose shape the core does not know
 *
 * Used for custom plugin commands, which may have arbitrary method names and parameters.
 * params is kept as an opaque JSON value.
 */
struct PlaceholderRpc {
    std::string method;
    json params;
    RpcType rpcType = RpcType::Notification;

    static std::optional<PlaceholderRpc> fromJson(const json& j);
    json toJson() const;

    bool operator==(const PlaceholderRpc&) const = default;
};

struct PluginStart {
    static constexpr std::string_view kCommand = "start";
    ViewIdentifier viewId;
    std::string pluginName;
    bool operator==(const PluginStart&) const = default;
};

struct PluginStop {
    static constexpr std::string_view kCommand = "stop";
    ViewIdentifier viewId;
    std::string pluginName;
    bool operator==(const PluginStop&) const = default;
};

struct PluginRpc {
    static constexpr std::string_view kCommand = "plugin_rpc";
    ViewIdentifier viewId;
    std::string receiver;
    PlaceholderRpc rpc;
    bool operator==(const PluginRpc&) const = default;
};

/**
 * @brief Plugin lifecycle and pass-through commands
 *
 * Internally tagged by `command` (not `method`) so plugin dispatch is never confused with
 * core dispatch: `{"command": "start", "view_id": "view-id-1", "plugin_name": "syntect"}`.
 * Every decode failure is MalformedPluginParams.
 */
class PluginNotification {
public:
    static constexpr std::string_view kMethod = "plugin";

    using Command = std::variant<PluginStart, PluginStop, PluginRpc>;

    PluginNotification(Command command) : command_(std::move(command)) {}

    static Result<PluginNotification> fromJson(const json& params);
    json toJson() const;

    std::string_view command() const;
    const Command& value() const noexcept { return command_; }

    template <typename C> const C* as() const noexcept { return std::get_if<C>(&command_); }

    bool operator==(const PluginNotification&) const = default;

private:
    Command command_;
};

} // namespace editrpc::protocol
