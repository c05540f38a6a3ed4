#include <editrpc/protocol/core_commands.h>

#include "json_fields.h"

namespace editrpc::protocol {

namespace {

using detail::optionalStringField;
using detail::stringField;

template <typename C> Error malformed(const json& params, std::string reason = "") {
    return Error::malformedCoreParams(std::string(C::kMethod), params, std::move(reason));
}

using NotificationCodec = detail::TaggedUnion<CoreNotification>;
using RequestCodec = detail::TaggedUnion<CoreRequest>;

} // namespace

Result<CloseView> CloseView::fromJson(const json& params) {
    auto viewId = stringField(params, "view_id");
    if (!viewId) {
        return malformed<CloseView>(params);
    }
    return CloseView{ViewIdentifier{std::move(*viewId)}};
}

json CloseView::toJson() const {
    return json{{"view_id", viewId.str()}};
}

Result<Save> Save::fromJson(const json& params) {
    auto viewId = stringField(params, "view_id");
    auto filePath = stringField(params, "file_path");
    if (!viewId || !filePath) {
        return malformed<Save>(params);
    }
    return Save{ViewIdentifier{std::move(*viewId)}, std::move(*filePath)};
}

json Save::toJson() const {
    return json{{"view_id", viewId.str()}, {"file_path", filePath}};
}

Result<SetTheme> SetTheme::fromJson(const json& params) {
    auto themeName = stringField(params, "theme_name");
    if (!themeName) {
        return malformed<SetTheme>(params);
    }
    return SetTheme{std::move(*themeName)};
}

json SetTheme::toJson() const {
    return json{{"theme_name", themeName}};
}

Result<ClientStarted> ClientStarted::fromJson(const json& params) {
    if (!params.is_object()) {
        return malformed<ClientStarted>(params, "params must be an object");
    }
    return ClientStarted{};
}

json ClientStarted::toJson() const {
    return json::object();
}

Result<NewView> NewView::fromJson(const json& params) {
    if (!params.is_object()) {
        return malformed<NewView>(params, "params must be an object");
    }
    auto filePath = optionalStringField(params, "file_path");
    if (!filePath) {
        return malformed<NewView>(params);
    }
    return NewView{std::move(*filePath)};
}

json NewView::toJson() const {
    json out = json::object();
    if (filePath) {
        out["file_path"] = *filePath;
    }
    return out;
}

Result<CoreNotification> decodeNotification(std::string_view method, const json& params) {
    return NotificationCodec::decode(method, params);
}

Result<CoreRequest> decodeRequest(std::string_view method, const json& params) {
    return RequestCodec::decode(method, params);
}

Result<CoreNotification> decodeNotificationEnvelope(const json& envelope) {
    return NotificationCodec::decodeEnvelope(envelope);
}

Result<CoreRequest> decodeRequestEnvelope(const json& envelope) {
    return RequestCodec::decodeEnvelope(envelope);
}

json encode(const CoreNotification& notification) {
    return NotificationCodec::encode(notification);
}

json encode(const CoreRequest& request) {
    return RequestCodec::encode(request);
}

std::string_view methodName(const CoreNotification& notification) {
    return NotificationCodec::methodName(notification);
}

std::string_view methodName(const CoreRequest& request) {
    return RequestCodec::methodName(request);
}

} // namespace editrpc::protocol
