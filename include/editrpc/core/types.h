#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace editrpc {

using json = nlohmann::json;

// Decode error kinds. Closed set: structural failures in adapters and positional codecs are
// reported as the enclosing grammar's malformed-params kind.
enum class ErrorCode {
    UnknownCoreMethod,
    MalformedCoreParams,
    UnknownEditMethod,
    MalformedEditParams,
    MalformedPluginParams
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::UnknownCoreMethod: return "Unknown core method";
        case ErrorCode::MalformedCoreParams: return "Malformed core parameters";
        case ErrorCode::UnknownEditMethod: return "Unknown edit method";
        case ErrorCode::MalformedEditParams: return "Malformed edit parameters";
        case ErrorCode::MalformedPluginParams: return "Malformed plugin parameters";
    }
    return "Unknown error";
}

// Error struct carrying the offending method name and, for malformed kinds, the raw payload
struct Error {
    ErrorCode code;
    std::string method;
    json params;        // null for the unknown-method kinds
    std::string detail; // optional qualifier, e.g. "missing 'method' field"

    Error(ErrorCode c, std::string m, json p = nullptr, std::string d = "")
        : code(c), method(std::move(m)), params(std::move(p)), detail(std::move(d)) {}

    static Error unknownCoreMethod(std::string method, std::string detail = "") {
        return Error{ErrorCode::UnknownCoreMethod, std::move(method), nullptr, std::move(detail)};
    }
    static Error malformedCoreParams(std::string method, json params, std::string detail = "") {
        return Error{ErrorCode::MalformedCoreParams, std::move(method), std::move(params),
                     std::move(detail)};
    }
    static Error unknownEditMethod(std::string method) {
        return Error{ErrorCode::UnknownEditMethod, std::move(method)};
    }
    static Error malformedEditParams(std::string method, json params, std::string detail = "") {
        return Error{ErrorCode::MalformedEditParams, std::move(method), std::move(params),
                     std::move(detail)};
    }
    static Error malformedPluginParams(std::string method, json params, std::string detail = "") {
        return Error{ErrorCode::MalformedPluginParams, std::move(method), std::move(params),
                     std::move(detail)};
    }

    bool isMalformed() const noexcept {
        return code == ErrorCode::MalformedCoreParams || code == ErrorCode::MalformedEditParams ||
               code == ErrorCode::MalformedPluginParams;
    }

    // Display form: "Error: <kind> ..." with method name and, for malformed kinds, the payload
    std::string message() const {
        std::string out;
        switch (code) {
            case ErrorCode::UnknownCoreMethod:
                out = "Error: Unknown core method '" + method + "'";
                break;
            case ErrorCode::MalformedCoreParams:
                out = "Error: Malformed core parameters with method '" + method +
                      "', parameters: " + params.dump();
                break;
            case ErrorCode::UnknownEditMethod:
                out = "Error: Unknown edit method '" + method + "'";
                break;
            case ErrorCode::MalformedEditParams:
                out = "Error: Malformed edit parameters with method '" + method +
                      "', parameters: " + params.dump();
                break;
            case ErrorCode::MalformedPluginParams:
                out = "Error: Malformed plugin parameters with method '" + method +
                      "', parameters: " + params.dump();
                break;
        }
        if (!detail.empty()) {
            out += " (" + detail + ")";
        }
        return out;
    }

    bool operator==(const Error& other) const {
        return code == other.code && method == other.method && params == other.params &&
               detail == other.detail;
    }

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

} // namespace editrpc

// Format support for ErrorCode
#include <format>
template <> struct std::formatter<editrpc::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(editrpc::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", editrpc::errorToString(error));
    }
};

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<editrpc::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(editrpc::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", editrpc::errorToString(error));
    }
};
#endif
