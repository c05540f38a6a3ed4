#include <editrpc/protocol/plugin_commands.h>

#include "json_fields.h"

#include <type_traits>

namespace editrpc::protocol {

namespace {

using detail::findField;
using detail::stringField;

Error malformed(std::string_view command, const json& params, std::string reason = "") {
    return Error::malformedPluginParams(std::string(command), params, std::move(reason));
}

// start and stop share a shape
template <typename C> Result<PluginNotification> decodeLifecycle(const json& params) {
    auto viewId = stringField(params, "view_id");
    auto pluginName = stringField(params, "plugin_name");
    if (!viewId || !pluginName) {
        return malformed(C::kCommand, params);
    }
    return PluginNotification{C{ViewIdentifier{std::move(*viewId)}, std::move(*pluginName)}};
}

Result<PluginNotification> decodePluginRpc(const json& params) {
    auto viewId = stringField(params, "view_id");
    auto receiver = stringField(params, "receiver");
    const json* rpcField = findField(params, "rpc");
    auto rpc = rpcField ? PlaceholderRpc::fromJson(*rpcField) : std::nullopt;
    if (!viewId || !receiver || !rpc) {
        return malformed(PluginRpc::kCommand, params);
    }
    return PluginNotification{
        PluginRpc{ViewIdentifier{std::move(*viewId)}, std::move(*receiver), std::move(*rpc)}};
}

} // namespace

std::optional<RpcType> rpcTypeFromString(std::string_view name) {
    if (name == "notification") {
        return RpcType::Notification;
    }
    if (name == "request") {
        return RpcType::Request;
    }
    return std::nullopt;
}

std::string_view toString(RpcType type) {
    switch (type) {
        case RpcType::Notification:
            return "notification";
        case RpcType::Request:
            return "request";
    }
    return "unknown";
}

std::optional<PlaceholderRpc> PlaceholderRpc::fromJson(const json& j) {
    auto method = stringField(j, "method");
    const json* params = findField(j, "params");
    auto rpcTypeName = stringField(j, "rpc_type");
    auto rpcType = rpcTypeName ? rpcTypeFromString(*rpcTypeName) : std::nullopt;
    if (!method || !params || !rpcType) {
        return std::nullopt;
    }
    return PlaceholderRpc{std::move(*method), *params, *rpcType};
}

json PlaceholderRpc::toJson() const {
    return json{{"method", method}, {"params", params}, {"rpc_type", std::string(toString(rpcType))}};
}

Result<PluginNotification> PluginNotification::fromJson(const json& params) {
    if (!params.is_object()) {
        return malformed("", params, "params must be an object");
    }
    auto command = stringField(params, "command");
    if (!command) {
        return malformed("", params, "missing 'command' field");
    }

    if (*command == PluginStart::kCommand) {
        return decodeLifecycle<PluginStart>(params);
    }
    if (*command == PluginStop::kCommand) {
        return decodeLifecycle<PluginStop>(params);
    }
    if (*command == PluginRpc::kCommand) {
        return decodePluginRpc(params);
    }
    return malformed(*command, params, "unknown plugin command");
}

json PluginNotification::toJson() const {
    return std::visit(
        [](const auto& cmd) -> json {
            using C = std::decay_t<decltype(cmd)>;
            json out{{"command", std::string(C::kCommand)}, {"view_id", cmd.viewId.str()}};
            if constexpr (std::is_same_v<C, PluginRpc>) {
                out["receiver"] = cmd.receiver;
                out["rpc"] = cmd.rpc.toJson();
            } else {
                out["plugin_name"] = cmd.pluginName;
            }
            return out;
        },
        command_);
}

std::string_view PluginNotification::command() const {
    return std::visit([](const auto& cmd) { return std::decay_t<decltype(cmd)>::kCommand; },
                      command_);
}

} // namespace editrpc::protocol
