#pragma once

#include <nlohmann/json.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <editrpc/core/types.h>
#include <editrpc/protocol/plugin_commands.h>
#include <editrpc/protocol/view_command.h>
#include <editrpc/protocol/view_identifier.h>

namespace editrpc::protocol {

using json = nlohmann::json;

// ============================================================================
// Core command payloads
// ============================================================================

struct CloseView {
    static constexpr std::string_view kMethod = "close_view";
    ViewIdentifier viewId;

    static Result<CloseView> fromJson(const json& params);
    json toJson() const;
    bool operator==(const CloseView&) const = default;
};

struct Save {
    static constexpr std::string_view kMethod = "save";
    ViewIdentifier viewId;
    std::string filePath;

    static Result<Save> fromJson(const json& params);
    json toJson() const;
    bool operator==(const Save&) const = default;
};

struct SetTheme {
    static constexpr std::string_view kMethod = "set_theme";
    std::string themeName;

    static Result<SetTheme> fromJson(const json& params);
    json toJson() const;
    bool operator==(const SetTheme&) const = default;
};

struct ClientStarted {
    static constexpr std::string_view kMethod = "client_started";

    static Result<ClientStarted> fromJson(const json& params);
    json toJson() const;
    bool operator==(const ClientStarted&) const = default;
};

struct NewView {
    static constexpr std::string_view kMethod = "new_view";
    std::optional<std::string> filePath;

    static Result<NewView> fromJson(const json& params);
    json toJson() const;
    bool operator==(const NewView&) const = default;
};

// Concept for alternatives of a method/params tagged union
template <typename T>
concept CoreCommand = requires(const T& cmd, const json& params) {
    { T::kMethod } -> std::convertible_to<std::string_view>;
    { T::fromJson(params) } -> std::same_as<Result<T>>;
    { cmd.toJson() } -> std::same_as<json>;
};

// ============================================================================
// Top-level unions
// ============================================================================

using CoreNotification = std::variant<EditNotificationCommand, PluginNotification, CloseView, Save,
                                      SetTheme, ClientStarted>;

using CoreRequest = std::variant<EditRequestCommand, NewView>;

namespace detail {

template <typename Union, CoreCommand Alt, CoreCommand... Rest>
Result<Union> decodeAlternative(std::string_view method, const json& params) {
    if (method == Alt::kMethod) {
        auto decoded = Alt::fromJson(params);
        if (!decoded) {
            return decoded.error();
        }
        return Union{std::in_place_type<Alt>, std::move(decoded).value()};
    }
    if constexpr (sizeof...(Rest) > 0) {
        return decodeAlternative<Union, Rest...>(method, params);
    } else {
        return Error::unknownCoreMethod(std::string(method));
    }
}

/**
 * @brief Adjacently tagged (method/params) codec for a variant of core commands
 *
 * The method string selects the unique alternative whose kMethod matches; there is no
 * fallback alternative.
 */
template <typename Union> struct TaggedUnion;

template <CoreCommand... Alts> struct TaggedUnion<std::variant<Alts...>> {
    using Union = std::variant<Alts...>;

    static Result<Union> decode(std::string_view method, const json& params) {
        return decodeAlternative<Union, Alts...>(method, params);
    }

    // Decode straight from a whole `{"method": ..., "params"?: ...}` object
    static Result<Union> decodeEnvelope(const json& envelope) {
        if (!envelope.is_object()) {
            return Error::unknownCoreMethod("", "message is not an object");
        }
        auto method = envelope.find("method");
        if (method == envelope.end() || !method->is_string()) {
            return Error::unknownCoreMethod("", "missing 'method' field");
        }
        auto params = envelope.find("params");
        static const json kAbsent;
        return decode(method->template get_ref<const std::string&>(),
                      params == envelope.end() ? kAbsent : *params);
    }

    static json encode(const Union& value) {
        return std::visit(
            [](const auto& alt) {
                return json{{"method", std::string(alt.kMethod)}, {"params", alt.toJson()}};
            },
            value);
    }

    static std::string_view methodName(const Union& value) {
        return std::visit([](const auto& alt) { return std::string_view{alt.kMethod}; }, value);
    }
};

} // namespace detail

/**
 * @brief Decode a core notification from its method name and params
 *
 * Entry point used by the engine once a message has been classified. An absent params field
 * is passed as null.
 * @return UnknownCoreMethod, MalformedCoreParams, or the edit/plugin sub-grammar errors
 */
Result<CoreNotification> decodeNotification(std::string_view method, const json& params);

/// Decode a core request from its method name and params
Result<CoreRequest> decodeRequest(std::string_view method, const json& params);

/// Decode from a whole envelope, selecting the variant by its method field
Result<CoreNotification> decodeNotificationEnvelope(const json& envelope);
Result<CoreRequest> decodeRequestEnvelope(const json& envelope);

/// Encode to a `{"method": ..., "params": ...}` envelope
json encode(const CoreNotification& notification);
json encode(const CoreRequest& request);

std::string_view methodName(const CoreNotification& notification);
std::string_view methodName(const CoreRequest& request);

} // namespace editrpc::protocol
