#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <editrpc/core/types.h>
#include <editrpc/protocol/core_commands.h>
#include <editrpc/protocol/plugin_commands.h>

namespace editrpc::protocol {

using json = nlohmann::json;

// ============================================================================
// Decoded messages
// ============================================================================

struct IncomingNotification {
    CoreNotification command;
    bool operator==(const IncomingNotification&) const = default;
};

struct IncomingRequest {
    json id; // correlation id, returned untouched to the caller
    CoreRequest command;
    bool operator==(const IncomingRequest&) const = default;
};

using IncomingMessage = std::variant<IncomingNotification, IncomingRequest>;

RpcType rpcType(const IncomingMessage& message);

// ============================================================================
// Classification
// ============================================================================

/// Envelope fields borrowed from a parsed message; valid while that message lives
struct RpcCall {
    const json* id = nullptr;
    std::string_view method;
    const json* params = nullptr;

    // A present id, even null, makes the message a request
    bool isRequest() const noexcept { return id != nullptr; }
};

/// Envelope fields moved out of a parsed message
struct OwnedRpcCall {
    std::optional<json> id;
    std::string method;
    json params; // null when absent

    bool isRequest() const noexcept { return id.has_value(); }
};

/**
 * @brief Split a message into id, method and params without copying
 * @return UnknownCoreMethod("") when the message is not an object or has no string method
 */
Result<RpcCall> classifyMessage(const json& message);

/// Same contract as classifyMessage, but strips id and moves method/params out of the message
Result<OwnedRpcCall> takeRpcCall(json&& message);

// ============================================================================
// Decoding
// ============================================================================

/**
 * @brief Decoding strategies, interchangeable behind the same contract
 *
 * - Borrowed: parse, then dispatch on method/params referenced inside the parsed document.
 * - Owned: parse, strip id, move method/params into an owned call, then dispatch.
 * - Tagged: parse, then let the request/notification union decode the whole envelope.
 */
enum class DecodeStrategy { Borrowed, Owned, Tagged };

std::optional<DecodeStrategy> parseDecodeStrategy(std::string_view name);
std::string_view toString(DecodeStrategy strategy);

Result<IncomingMessage> decodeBorrowed(std::string_view line);
Result<IncomingMessage> decodeOwned(std::string_view line);
Result<IncomingMessage> decodeTagged(std::string_view line);

/// Decode one line of input (one JSON object) into a typed request or notification
Result<IncomingMessage> decodeMessage(std::string_view line,
                                      DecodeStrategy strategy = DecodeStrategy::Borrowed);

/// Wire form of a decoded message, including the id for requests
json encodeMessage(const IncomingMessage& message);

} // namespace editrpc::protocol
