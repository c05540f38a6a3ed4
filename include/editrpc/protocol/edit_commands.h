#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <editrpc/core/types.h>
#include <editrpc/protocol/positional.h>

namespace editrpc::protocol {

using json = nlohmann::json;

// ============================================================================
// Edit notifications
// ============================================================================

enum class EditNotificationMethod : uint8_t {
    Insert,
    DeleteForward,
    DeleteBackward,
    DeleteWordForward,
    DeleteWordBackward,
    DeleteToEndOfParagraph,
    DeleteToBeginningOfLine,
    InsertNewline,
    InsertTab,
    MoveUp,
    MoveUpAndModifySelection,
    MoveDown,
    MoveDownAndModifySelection,
    MoveLeft,
    MoveLeftAndModifySelection,
    MoveRight,
    MoveRightAndModifySelection,
    MoveWordLeft,
    MoveWordLeftAndModifySelection,
    MoveWordRight,
    MoveWordRightAndModifySelection,
    MoveToBeginningOfParagraph,
    MoveToEndOfParagraph,
    MoveToLeftEndOfLine,
    MoveToLeftEndOfLineAndModifySelection,
    MoveToRightEndOfLine,
    MoveToRightEndOfLineAndModifySelection,
    MoveToBeginningOfDocument,
    MoveToBeginningOfDocumentAndModifySelection,
    MoveToEndOfDocument,
    MoveToEndOfDocumentAndModifySelection,
    ScrollPageUp,
    PageUpAndModifySelection,
    ScrollPageDown,
    PageDownAndModifySelection,
    SelectAll,
    AddSelectionAbove,
    AddSelectionBelow,
    Scroll,
    GotoLine,
    RequestLines,
    Yank,
    Transpose,
    Click,
    Drag,
    Gesture,
    Undo,
    Redo,
    FindNext,
    FindPrevious,
    DebugRewrap,
    DebugPrintSpans
};

inline constexpr std::size_t kEditNotificationMethodCount =
    static_cast<std::size_t>(EditNotificationMethod::DebugPrintSpans) + 1;

std::string_view methodName(EditNotificationMethod method);
std::optional<EditNotificationMethod> parseEditNotificationMethod(std::string_view name);

// True for methods that carry no params
bool isUnitMethod(EditNotificationMethod method);

struct InsertParams {
    std::string chars;
    bool operator==(const InsertParams&) const = default;
};

struct GotoLineParams {
    uint64_t line = 0;
    bool operator==(const GotoLineParams&) const = default;
};

struct GestureParams {
    uint64_t line = 0;
    uint64_t column = 0;
    GestureType ty = GestureType::ToggleSel;
    bool operator==(const GestureParams&) const = default;
};

struct FindNextParams {
    bool wrapAround = false;
    bool allowSame = false;
    bool operator==(const FindNextParams&) const = default;
};

struct FindPreviousParams {
    bool wrapAround = false;
    bool operator==(const FindPreviousParams&) const = default;
};

using EditNotificationParams =
    std::variant<std::monostate, InsertParams, LineRange, MouseAction, GotoLineParams,
                 GestureParams, FindNextParams, FindPreviousParams>;

/**
 * @brief Edit command sent to a view without expecting a reply
 *
 * Adjacently tagged on the wire: `{"method": "<name>", "params": <payload>}`. Unit methods
 * carry no params. The method always agrees with the payload alternative; instances are
 * built through the named factories or by decoding.
 */
class EditNotification {
public:
    // Unit-shaped commands (delete_forward, undo, ...). Throws std::invalid_argument when the
    // method requires a payload.
    static EditNotification command(EditNotificationMethod method);

    static EditNotification insert(std::string chars);
    static EditNotification scroll(LineRange range);
    static EditNotification requestLines(LineRange range);
    // Throw std::invalid_argument for a click count of zero, which cannot be decoded back
    static EditNotification click(MouseAction action);
    static EditNotification drag(MouseAction action);
    static EditNotification gotoLine(uint64_t line);
    static EditNotification gesture(uint64_t line, uint64_t column, GestureType ty);
    static EditNotification findNext(bool wrapAround, bool allowSame);
    static EditNotification findPrevious(bool wrapAround);

    /**
     * @brief Decode from a method name and optional params
     * @param params nullptr when the params field is absent
     * @return UnknownEditMethod for unrecognized names, MalformedEditParams when the payload
     *         does not fit the method
     */
    static Result<EditNotification> fromJson(std::string_view method, const json* params);

    /// Decode from an envelope of the form `{"method": ..., "params"?: ...}`
    static Result<EditNotification> fromJson(const json& envelope);

    json toJson() const;

    EditNotificationMethod method() const noexcept { return method_; }
    std::string_view name() const { return methodName(method_); }
    const EditNotificationParams& params() const noexcept { return params_; }

    template <typename P> const P* paramsAs() const noexcept { return std::get_if<P>(&params_); }

    bool operator==(const EditNotification&) const = default;

private:
    EditNotification(EditNotificationMethod method, EditNotificationParams params)
        : method_(method), params_(std::move(params)) {}

    EditNotificationMethod method_;
    EditNotificationParams params_;
};

// ============================================================================
// Edit requests
// ============================================================================

enum class EditRequestMethod : uint8_t { Cut, Copy, Find };

std::string_view methodName(EditRequestMethod method);
std::optional<EditRequestMethod> parseEditRequestMethod(std::string_view name);

struct FindParams {
    std::optional<std::string> chars;
    bool caseSensitive = false;
    bool operator==(const FindParams&) const = default;
};

using EditRequestParams = std::variant<std::monostate, FindParams>;

/// Edit command that expects a reply (clipboard contents, find results)
class EditRequest {
public:
    static EditRequest cut();
    static EditRequest copy();
    static EditRequest find(std::optional<std::string> chars, bool caseSensitive);

    static Result<EditRequest> fromJson(std::string_view method, const json* params);
    static Result<EditRequest> fromJson(const json& envelope);

    json toJson() const;

    EditRequestMethod method() const noexcept { return method_; }
    std::string_view name() const { return methodName(method_); }
    const EditRequestParams& params() const noexcept { return params_; }

    template <typename P> const P* paramsAs() const noexcept { return std::get_if<P>(&params_); }

    bool operator==(const EditRequest&) const = default;

private:
    EditRequest(EditRequestMethod method, EditRequestParams params)
        : method_(method), params_(std::move(params)) {}

    EditRequestMethod method_;
    EditRequestParams params_;
};

} // namespace editrpc::protocol
