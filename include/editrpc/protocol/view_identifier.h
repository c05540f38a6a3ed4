#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace editrpc::protocol {

/// Opaque client-assigned name of a document view. The primary routing key for edit
/// commands; ordering exists only for deterministic iteration and display.
class ViewIdentifier {
public:
    ViewIdentifier() = default;
    explicit ViewIdentifier(std::string id) : id_(std::move(id)) {}

    const std::string& str() const noexcept { return id_; }
    std::string_view view() const noexcept { return id_; }

    auto operator<=>(const ViewIdentifier&) const = default;
    bool operator==(const ViewIdentifier&) const = default;

private:
    std::string id_;
};

} // namespace editrpc::protocol

template <> struct std::hash<editrpc::protocol::ViewIdentifier> {
    std::size_t operator()(const editrpc::protocol::ViewIdentifier& id) const noexcept {
        return std::hash<std::string_view>{}(id.view());
    }
};
