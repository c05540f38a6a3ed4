#include <editrpc/protocol/view_command.h>

#include "json_fields.h"

namespace editrpc::protocol::detail {

namespace {

Error malformedEdit(const json& payload, std::string reason) {
    return Error::malformedCoreParams(std::string(kEditMethod), payload, std::move(reason));
}

} // namespace

Result<ViewScopedParts> extractViewScoped(const json& payload) {
    if (!payload.is_object()) {
        return malformedEdit(payload, "params must be an object");
    }

    auto viewId = stringFieldView(payload, "view_id");
    if (!viewId) {
        return malformedEdit(payload, "missing or non-string 'view_id'");
    }

    auto method = stringFieldView(payload, "method");
    if (!method) {
        return malformedEdit(payload, "missing or non-string 'method'");
    }

    const json* rawParams = findField(payload, "params");
    const json* params = rawParams;
    if (params) {
        if (params->is_object() || params->is_array()) {
            if (params->empty()) {
                params = nullptr;
            }
        } else {
            return malformedEdit(payload, "'params' field, if present, must be object or array");
        }
    }

    return ViewScopedParts{*viewId, *method, params, rawParams};
}

Error withRawParams(Error error, const ViewScopedParts& parts) {
    if (error.isMalformed() && parts.params == nullptr && parts.rawParams != nullptr) {
        error.params = *parts.rawParams;
    }
    return error;
}

json mergeViewId(json command, const ViewIdentifier& viewId) {
    command["view_id"] = viewId.str();
    return command;
}

} // namespace editrpc::protocol::detail
