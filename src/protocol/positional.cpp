#include <editrpc/protocol/positional.h>

namespace editrpc::protocol {

std::optional<uint64_t> asUnsigned(const json& j) {
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    if (j.is_number_integer()) {
        auto v = j.get<int64_t>();
        if (v >= 0) {
            return static_cast<uint64_t>(v);
        }
    }
    return std::nullopt;
}

std::optional<LineRange> LineRange::fromJson(const json& j) {
    if (!j.is_array() || j.size() != 2) {
        return std::nullopt;
    }
    auto start = asUnsigned(j[0]);
    auto end = asUnsigned(j[1]);
    if (!start || !end) {
        return std::nullopt;
    }
    return LineRange{*start, *end};
}

json LineRange::toJson() const {
    return json::array({start, end});
}

std::optional<MouseAction> MouseAction::fromJson(const json& j) {
    if (!j.is_array() || (j.size() != 3 && j.size() != 4)) {
        return std::nullopt;
    }
    auto line = asUnsigned(j[0]);
    auto column = asUnsigned(j[1]);
    auto flags = asUnsigned(j[2]);
    if (!line || !column || !flags) {
        return std::nullopt;
    }

    MouseAction action{*line, *column, *flags, std::nullopt};
    if (j.size() == 4) {
        auto clicks = asUnsigned(j[3]);
        if (!clicks || *clicks == 0) {
            return std::nullopt;
        }
        action.clickCount = *clicks;
    }
    return action;
}

json MouseAction::toJson() const {
    auto out = json::array({line, column, flags});
    if (clickCount) {
        out.push_back(*clickCount);
    }
    return out;
}

std::optional<GestureType> gestureTypeFromString(std::string_view name) {
    if (name == "toggle_sel") {
        return GestureType::ToggleSel;
    }
    return std::nullopt;
}

std::string_view toString(GestureType type) {
    switch (type) {
        case GestureType::ToggleSel:
            return "toggle_sel";
    }
    return "unknown";
}

} // namespace editrpc::protocol
