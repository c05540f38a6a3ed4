#include <editrpc/protocol/message_decoder.h>

#include <type_traits>
#include <utility>

namespace editrpc::protocol {

namespace {

constexpr const char* kNotAnObject = "message is not an object";
constexpr const char* kMissingMethod = "missing 'method' field";

// Malformed JSON below the object level is a framing problem; it is reported as a message
// without a method so the caller still gets a value, never an exception. Numeric overflow
// surfaces as out_of_range rather than parse_error.
Result<json> parseLine(std::string_view line) {
    try {
        return json::parse(line);
    } catch (const json::exception& e) {
        return Error::unknownCoreMethod("", std::string("invalid JSON: ") + e.what());
    }
}

Result<IncomingMessage> dispatch(const json* id, std::string_view method, const json& params) {
    if (id) {
        auto request = decodeRequest(method, params);
        if (!request) {
            return request.error();
        }
        return IncomingMessage{IncomingRequest{*id, std::move(request).value()}};
    }
    auto notification = decodeNotification(method, params);
    if (!notification) {
        return notification.error();
    }
    return IncomingMessage{IncomingNotification{std::move(notification).value()}};
}

} // namespace

RpcType rpcType(const IncomingMessage& message) {
    return std::holds_alternative<IncomingRequest>(message) ? RpcType::Request
                                                            : RpcType::Notification;
}

Result<RpcCall> classifyMessage(const json& message) {
    if (!message.is_object()) {
        return Error::unknownCoreMethod("", kNotAnObject);
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return Error::unknownCoreMethod("", kMissingMethod);
    }

    RpcCall call;
    call.method = method->get_ref<const std::string&>();
    if (auto id = message.find("id"); id != message.end()) {
        call.id = &*id;
    }
    if (auto params = message.find("params"); params != message.end()) {
        call.params = &*params;
    }
    return call;
}

Result<OwnedRpcCall> takeRpcCall(json&& message) {
    if (!message.is_object()) {
        return Error::unknownCoreMethod("", kNotAnObject);
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return Error::unknownCoreMethod("", kMissingMethod);
    }

    OwnedRpcCall call;
    call.method = std::move(method->get_ref<std::string&>());
    if (auto id = message.find("id"); id != message.end()) {
        call.id = std::move(*id);
        message.erase(id);
    }
    if (auto params = message.find("params"); params != message.end()) {
        call.params = std::move(*params);
    }
    return call;
}

std::optional<DecodeStrategy> parseDecodeStrategy(std::string_view name) {
    if (name == "borrowed") {
        return DecodeStrategy::Borrowed;
    }
    if (name == "owned") {
        return DecodeStrategy::Owned;
    }
    if (name == "tagged") {
        return DecodeStrategy::Tagged;
    }
    return std::nullopt;
}

std::string_view toString(DecodeStrategy strategy) {
    switch (strategy) {
        case DecodeStrategy::Borrowed:
            return "borrowed";
        case DecodeStrategy::Owned:
            return "owned";
        case DecodeStrategy::Tagged:
            return "tagged";
    }
    return "unknown";
}

Result<IncomingMessage> decodeBorrowed(std::string_view line) {
    auto parsed = parseLine(line);
    if (!parsed) {
        return parsed.error();
    }
    auto call = classifyMessage(parsed.value());
    if (!call) {
        return call.error();
    }
    const auto& c = call.value();
    const json absent;
    return dispatch(c.id, c.method, c.params ? *c.params : absent);
}

Result<IncomingMessage> decodeOwned(std::string_view line) {
    auto parsed = parseLine(line);
    if (!parsed) {
        return parsed.error();
    }
    auto call = takeRpcCall(std::move(parsed).value());
    if (!call) {
        return call.error();
    }
    const auto& c = call.value();
    return dispatch(c.id ? &*c.id : nullptr, c.method, c.params);
}

Result<IncomingMessage> decodeTagged(std::string_view line) {
    auto parsed = parseLine(line);
    if (!parsed) {
        return parsed.error();
    }
    const json& message = parsed.value();
    if (!message.is_object()) {
        return Error::unknownCoreMethod("", kNotAnObject);
    }

    if (auto id = message.find("id"); id != message.end()) {
        auto request = decodeRequestEnvelope(message);
        if (!request) {
            return request.error();
        }
        return IncomingMessage{IncomingRequest{*id, std::move(request).value()}};
    }
    auto notification = decodeNotificationEnvelope(message);
    if (!notification) {
        return notification.error();
    }
    return IncomingMessage{IncomingNotification{std::move(notification).value()}};
}

Result<IncomingMessage> decodeMessage(std::string_view line, DecodeStrategy strategy) {
    switch (strategy) {
        case DecodeStrategy::Borrowed:
            return decodeBorrowed(line);
        case DecodeStrategy::Owned:
            return decodeOwned(line);
        case DecodeStrategy::Tagged:
            return decodeTagged(line);
    }
    return decodeBorrowed(line);
}

json encodeMessage(const IncomingMessage& message) {
    return std::visit(
        [](const auto& m) -> json {
            using M = std::decay_t<decltype(m)>;
            json out = encode(m.command);
            if constexpr (std::is_same_v<M, IncomingRequest>) {
                out["id"] = m.id;
            }
            return out;
        },
        message);
}

} // namespace editrpc::protocol
