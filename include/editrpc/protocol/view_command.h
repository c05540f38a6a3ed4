#pragma once

#include <nlohmann/json.hpp>

#include <concepts>
#include <string>
#include <string_view>
#include <utility>

#include <editrpc/core/types.h>
#include <editrpc/protocol/edit_commands.h>
#include <editrpc/protocol/view_identifier.h>

namespace editrpc::protocol {

using json = nlohmann::json;

// Core method under which view-scoped commands are routed
inline constexpr std::string_view kEditMethod = "edit";

// Concept for command grammars that can be routed to a view
template <typename T>
concept ViewScopedGrammar = requires(const T& cmd, std::string_view method, const json* params) {
    { T::fromJson(method, params) } -> std::same_as<Result<T>>;
    { cmd.toJson() } -> std::same_as<json>;
};

namespace detail {

// Fields of a view-scoped payload, borrowed from the payload object
struct ViewScopedParts {
    std::string_view viewId;
    std::string_view method;
    const json* params = nullptr;    // nullptr when absent or empty
    const json* rawParams = nullptr; // as sent, nullptr only when absent
};

/**
 * @brief Extract view_id and the inner method/params from an edit payload
 *
 * Empty object or array params are normalized away so unit commands decode the same whether
 * params is omitted, `{}` or `[]`. Structural failures are MalformedCoreParams("edit").
 */
Result<ViewScopedParts> extractViewScoped(const json& payload);

/// Report the params as sent when the inner grammar rejected a normalized empty payload
Error withRawParams(Error error, const ViewScopedParts& parts);

/// Inject view_id into an encoded inner command
json mergeViewId(json command, const ViewIdentifier& viewId);

} // namespace detail

/**
 * @brief A command addressed to a specific view
 *
 * On the wire view_id is flattened into the command object rather than nested:
 * `{"view_id": "view-id-1", "method": "insert", "params": {"chars": "hi"}}`.
 */
template <ViewScopedGrammar T> class ViewScopedCommand {
public:
    static constexpr std::string_view kMethod = kEditMethod;

    ViewScopedCommand(ViewIdentifier viewId, T command)
        : viewId_(std::move(viewId)), command_(std::move(command)) {}

    const ViewIdentifier& viewId() const noexcept { return viewId_; }
    const T& command() const noexcept { return command_; }

    static Result<ViewScopedCommand> fromJson(const json& payload) {
        auto parts = detail::extractViewScoped(payload);
        if (!parts) {
            return parts.error();
        }
        const auto& p = parts.value();
        auto inner = T::fromJson(p.method, p.params);
        if (!inner) {
            return detail::withRawParams(inner.error(), p);
        }
        return ViewScopedCommand{ViewIdentifier{std::string(p.viewId)}, std::move(inner).value()};
    }

    json toJson() const { return detail::mergeViewId(command_.toJson(), viewId_); }

    bool operator==(const ViewScopedCommand&) const = default;

private:
    ViewIdentifier viewId_;
    T command_;
};

using EditNotificationCommand = ViewScopedCommand<EditNotification>;
using EditRequestCommand = ViewScopedCommand<EditRequest>;

} // namespace editrpc::protocol
