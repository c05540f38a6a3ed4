#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace editrpc::protocol {

using json = nlohmann::json;

// Several edit commands pass their named arguments as a params array. These types convert
// between that positional wire form and named fields.

/// Range of lines, wire form `[start, end]`.
struct LineRange {
    uint64_t start = 0;
    uint64_t end = 0;

    static std::optional<LineRange> fromJson(const json& j);
    json toJson() const;

    auto operator<=>(const LineRange&) const = default;
};

/// Mouse event, wire form `[line, column, flags]` or `[line, column, flags, click_count]`.
/// An unset click count means the event is not a multi-click; a present count is never zero.
/// Decoding rejects `[l, c, f, 0]`, and the click/drag command factories refuse to build it.
struct MouseAction {
    uint64_t line = 0;
    uint64_t column = 0;
    uint64_t flags = 0;
    std::optional<uint64_t> clickCount;

    static std::optional<MouseAction> fromJson(const json& j);
    json toJson() const;

    bool operator==(const MouseAction&) const = default;
};

/// Touch and mouse gestures applied to the text.
enum class GestureType { ToggleSel };

std::optional<GestureType> gestureTypeFromString(std::string_view name);
std::string_view toString(GestureType type);

// Non-negative JSON integer, or nullopt for any other value (floats, negatives, strings...)
std::optional<uint64_t> asUnsigned(const json& j);

} // namespace editrpc::protocol
