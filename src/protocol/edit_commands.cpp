#include <editrpc/protocol/edit_commands.h>

#include "json_fields.h"

#include <array>
#include <stdexcept>
#include <type_traits>

namespace editrpc::protocol {

namespace {

using detail::boolField;
using detail::optionalStringField;
using detail::stringField;
using detail::unsignedField;

// Indexed by EditNotificationMethod
constexpr std::array<std::string_view, kEditNotificationMethodCount> kEditNotificationNames{
    "insert",
    "delete_forward",
    "delete_backward",
    "delete_word_forward",
    "delete_word_backward",
    "delete_to_end_of_paragraph",
    "delete_to_beginning_of_line",
    "insert_newline",
    "insert_tab",
    "move_up",
    "move_up_and_modify_selection",
    "move_down",
    "move_down_and_modify_selection",
    "move_left",
    "move_left_and_modify_selection",
    "move_right",
    "move_right_and_modify_selection",
    "move_word_left",
    "move_word_left_and_modify_selection",
    "move_word_right",
    "move_word_right_and_modify_selection",
    "move_to_beginning_of_paragraph",
    "move_to_end_of_paragraph",
    "move_to_left_end_of_line",
    "move_to_left_end_of_line_and_modify_selection",
    "move_to_right_end_of_line",
    "move_to_right_end_of_line_and_modify_selection",
    "move_to_beginning_of_document",
    "move_to_beginning_of_document_and_modify_selection",
    "move_to_end_of_document",
    "move_to_end_of_document_and_modify_selection",
    "scroll_page_up",
    "page_up_and_modify_selection",
    "scroll_page_down",
    "page_down_and_modify_selection",
    "select_all",
    "add_selection_above",
    "add_selection_below",
    "scroll",
    "goto_line",
    "request_lines",
    "yank",
    "transpose",
    "click",
    "drag",
    "gesture",
    "undo",
    "redo",
    "find_next",
    "find_previous",
    "debug_rewrap",
    "debug_print_spans",
};

constexpr std::array<std::string_view, 3> kEditRequestNames{"cut", "copy", "find"};

json rawParams(const json* params) {
    return params ? *params : json(nullptr);
}

Error malformed(std::string_view method, const json* params, std::string reason = "") {
    return Error::malformedEditParams(std::string(method), rawParams(params), std::move(reason));
}

bool isAbsent(const json* params) {
    return params == nullptr || params->is_null();
}

// Splits an envelope into its method and optional params
template <typename Command>
Result<Command> decodeEnvelope(const json& envelope) {
    auto method = detail::stringFieldView(envelope, "method");
    if (!method) {
        return Error::unknownEditMethod("");
    }
    return Command::fromJson(*method, detail::findField(envelope, "params"));
}

json makeEnvelope(std::string_view method, const json* params) {
    json out = json::object();
    out["method"] = std::string(method);
    if (params) {
        out["params"] = *params;
    }
    return out;
}

// A present click count is never zero on the wire
void requireClickCount(const MouseAction& action) {
    if (action.clickCount && *action.clickCount == 0) {
        throw std::invalid_argument("mouse action click count must be at least 1");
    }
}

Result<EditNotification> decodeUnit(EditNotificationMethod method, const json* params) {
    if (!isAbsent(params)) {
        return malformed(methodName(method), params, "command takes no parameters");
    }
    return EditNotification::command(method);
}

} // namespace

// ============================================================================
// EditNotification
// ============================================================================

std::string_view methodName(EditNotificationMethod method) {
    return kEditNotificationNames[static_cast<std::size_t>(method)];
}

std::optional<EditNotificationMethod> parseEditNotificationMethod(std::string_view name) {
    for (std::size_t i = 0; i < kEditNotificationNames.size(); ++i) {
        if (kEditNotificationNames[i] == name) {
            return static_cast<EditNotificationMethod>(i);
        }
    }
    return std::nullopt;
}

bool isUnitMethod(EditNotificationMethod method) {
    switch (method) {
        case EditNotificationMethod::Insert:
        case EditNotificationMethod::Scroll:
        case EditNotificationMethod::GotoLine:
        case EditNotificationMethod::RequestLines:
        case EditNotificationMethod::Click:
        case EditNotificationMethod::Drag:
        case EditNotificationMethod::Gesture:
        case EditNotificationMethod::FindNext:
        case EditNotificationMethod::FindPrevious:
            return false;
        case EditNotificationMethod::DeleteForward:
        case EditNotificationMethod::DeleteBackward:
        case EditNotificationMethod::DeleteWordForward:
        case EditNotificationMethod::DeleteWordBackward:
        case EditNotificationMethod::DeleteToEndOfParagraph:
        case EditNotificationMethod::DeleteToBeginningOfLine:
        case EditNotificationMethod::InsertNewline:
        case EditNotificationMethod::InsertTab:
        case EditNotificationMethod::MoveUp:
        case EditNotificationMethod::MoveUpAndModifySelection:
        case EditNotificationMethod::MoveDown:
        case EditNotificationMethod::MoveDownAndModifySelection:
        case EditNotificationMethod::MoveLeft:
        case EditNotificationMethod::MoveLeftAndModifySelection:
        case EditNotificationMethod::MoveRight:
        case EditNotificationMethod::MoveRightAndModifySelection:
        case EditNotificationMethod::MoveWordLeft:
        case EditNotificationMethod::MoveWordLeftAndModifySelection:
        case EditNotificationMethod::MoveWordRight:
        case EditNotificationMethod::MoveWordRightAndModifySelection:
        case EditNotificationMethod::MoveToBeginningOfParagraph:
        case EditNotificationMethod::MoveToEndOfParagraph:
        case EditNotificationMethod::MoveToLeftEndOfLine:
        case EditNotificationMethod::MoveToLeftEndOfLineAndModifySelection:
        case EditNotificationMethod::MoveToRightEndOfLine:
        case EditNotificationMethod::MoveToRightEndOfLineAndModifySelection:
        case EditNotificationMethod::MoveToBeginningOfDocument:
        case EditNotificationMethod::MoveToBeginningOfDocumentAndModifySelection:
        case EditNotificationMethod::MoveToEndOfDocument:
        case EditNotificationMethod::MoveToEndOfDocumentAndModifySelection:
        case EditNotificationMethod::ScrollPageUp:
        case EditNotificationMethod::PageUpAndModifySelection:
        case EditNotificationMethod::ScrollPageDown:
        case EditNotificationMethod::PageDownAndModifySelection:
        case EditNotificationMethod::SelectAll:
        case EditNotificationMethod::AddSelectionAbove:
        case EditNotificationMethod::AddSelectionBelow:
        case EditNotificationMethod::Yank:
        case EditNotificationMethod::Transpose:
        case EditNotificationMethod::Undo:
        case EditNotificationMethod::Redo:
        case EditNotificationMethod::DebugRewrap:
        case EditNotificationMethod::DebugPrintSpans:
            return true;
    }
    return false;
}

EditNotification EditNotification::command(EditNotificationMethod method) {
    if (!isUnitMethod(method)) {
        throw std::invalid_argument("edit method '" + std::string(methodName(method)) +
                                    "' requires parameters");
    }
    return EditNotification{method, std::monostate{}};
}

EditNotification EditNotification::insert(std::string chars) {
    return EditNotification{EditNotificationMethod::Insert, InsertParams{std::move(chars)}};
}

EditNotification EditNotification::scroll(LineRange range) {
    return EditNotification{EditNotificationMethod::Scroll, range};
}

EditNotification EditNotification::requestLines(LineRange range) {
    return EditNotification{EditNotificationMethod::RequestLines, range};
}

EditNotification EditNotification::click(MouseAction action) {
    requireClickCount(action);
    return EditNotification{EditNotificationMethod::Click, action};
}

EditNotification EditNotification::drag(MouseAction action) {
    requireClickCount(action);
    return EditNotification{EditNotificationMethod::Drag, action};
}

EditNotification EditNotification::gotoLine(uint64_t line) {
    return EditNotification{EditNotificationMethod::GotoLine, GotoLineParams{line}};
}

EditNotification EditNotification::gesture(uint64_t line, uint64_t column, GestureType ty) {
    return EditNotification{EditNotificationMethod::Gesture, GestureParams{line, column, ty}};
}

EditNotification EditNotification::findNext(bool wrapAround, bool allowSame) {
    return EditNotification{EditNotificationMethod::FindNext,
                            FindNextParams{wrapAround, allowSame}};
}

EditNotification EditNotification::findPrevious(bool wrapAround) {
    return EditNotification{EditNotificationMethod::FindPrevious, FindPreviousParams{wrapAround}};
}

Result<EditNotification> EditNotification::fromJson(std::string_view name, const json* params) {
    auto parsed = parseEditNotificationMethod(name);
    if (!parsed) {
        return Error::unknownEditMethod(std::string(name));
    }
    const auto method = *parsed;

    switch (method) {
        case EditNotificationMethod::Insert: {
            if (!params) {
                return malformed(name, params);
            }
            auto chars = stringField(*params, "chars");
            if (!chars) {
                return malformed(name, params);
            }
            return insert(std::move(*chars));
        }
        case EditNotificationMethod::Scroll:
        case EditNotificationMethod::RequestLines: {
            auto range = params ? LineRange::fromJson(*params) : std::nullopt;
            if (!range) {
                return malformed(name, params);
            }
            return EditNotification{method, *range};
        }
        case EditNotificationMethod::Click:
        case EditNotificationMethod::Drag: {
            auto action = params ? MouseAction::fromJson(*params) : std::nullopt;
            if (!action) {
                return malformed(name, params);
            }
            return EditNotification{method, *action};
        }
        case EditNotificationMethod::GotoLine: {
            auto line = params ? unsignedField(*params, "line") : std::nullopt;
            if (!line) {
                return malformed(name, params);
            }
            return gotoLine(*line);
        }
        case EditNotificationMethod::Gesture: {
            if (!params) {
                return malformed(name, params);
            }
            auto line = unsignedField(*params, "line");
            auto column = unsignedField(*params, "column");
            auto ty = stringField(*params, "ty");
            auto gestureType = ty ? gestureTypeFromString(*ty) : std::nullopt;
            if (!line || !column || !gestureType) {
                return malformed(name, params);
            }
            return gesture(*line, *column, *gestureType);
        }
        case EditNotificationMethod::FindNext: {
            if (!params) {
                return malformed(name, params);
            }
            auto wrapAround = boolField(*params, "wrap_around");
            auto allowSame = boolField(*params, "allow_same");
            if (!wrapAround || !allowSame) {
                return malformed(name, params);
            }
            return findNext(*wrapAround, *allowSame);
        }
        case EditNotificationMethod::FindPrevious: {
            auto wrapAround = params ? boolField(*params, "wrap_around") : std::nullopt;
            if (!wrapAround) {
                return malformed(name, params);
            }
            return findPrevious(*wrapAround);
        }
        case EditNotificationMethod::DeleteForward:
        case EditNotificationMethod::DeleteBackward:
        case EditNotificationMethod::DeleteWordForward:
        case EditNotificationMethod::DeleteWordBackward:
        case EditNotificationMethod::DeleteToEndOfParagraph:
        case EditNotificationMethod::DeleteToBeginningOfLine:
        case EditNotificationMethod::InsertNewline:
        case EditNotificationMethod::InsertTab:
        case EditNotificationMethod::MoveUp:
        case EditNotificationMethod::MoveUpAndModifySelection:
        case EditNotificationMethod::MoveDown:
        case EditNotificationMethod::MoveDownAndModifySelection:
        case EditNotificationMethod::MoveLeft:
        case EditNotificationMethod::MoveLeftAndModifySelection:
        case EditNotificationMethod::MoveRight:
        case EditNotificationMethod::MoveRightAndModifySelection:
        case EditNotificationMethod::MoveWordLeft:
        case EditNotificationMethod::MoveWordLeftAndModifySelection:
        case EditNotificationMethod::MoveWordRight:
        case EditNotificationMethod::MoveWordRightAndModifySelection:
        case EditNotificationMethod::MoveToBeginningOfParagraph:
        case EditNotificationMethod::MoveToEndOfParagraph:
        case EditNotificationMethod::MoveToLeftEndOfLine:
        case EditNotificationMethod::MoveToLeftEndOfLineAndModifySelection:
        case EditNotificationMethod::MoveToRightEndOfLine:
        case EditNotificationMethod::MoveToRightEndOfLineAndModifySelection:
        case EditNotificationMethod::MoveToBeginningOfDocument:
        case EditNotificationMethod::MoveToBeginningOfDocumentAndModifySelection:
        case EditNotificationMethod::MoveToEndOfDocument:
        case EditNotificationMethod::MoveToEndOfDocumentAndModifySelection:
        case EditNotificationMethod::ScrollPageUp:
        case EditNotificationMethod::PageUpAndModifySelection:
        case EditNotificationMethod::ScrollPageDown:
        case EditNotificationMethod::PageDownAndModifySelection:
        case EditNotificationMethod::SelectAll:
        case EditNotificationMethod::AddSelectionAbove:
        case EditNotificationMethod::AddSelectionBelow:
        case EditNotificationMethod::Yank:
        case EditNotificationMethod::Transpose:
        case EditNotificationMethod::Undo:
        case EditNotificationMethod::Redo:
        case EditNotificationMethod::DebugRewrap:
        case EditNotificationMethod::DebugPrintSpans:
            return decodeUnit(method, params);
    }
    return Error::unknownEditMethod(std::string(name));
}

Result<EditNotification> EditNotification::fromJson(const json& envelope) {
    return decodeEnvelope<EditNotification>(envelope);
}

json EditNotification::toJson() const {
    const auto name = methodName(method_);
    return std::visit(
        [&](const auto& p) -> json {
            using P = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<P, std::monostate>) {
                return makeEnvelope(name, nullptr);
            } else if constexpr (std::is_same_v<P, InsertParams>) {
                json params{{"chars", p.chars}};
                return makeEnvelope(name, &params);
            } else if constexpr (std::is_same_v<P, LineRange> || std::is_same_v<P, MouseAction>) {
                json params = p.toJson();
                return makeEnvelope(name, &params);
            } else if constexpr (std::is_same_v<P, GotoLineParams>) {
                json params{{"line", p.line}};
                return makeEnvelope(name, &params);
            } else if constexpr (std::is_same_v<P, GestureParams>) {
                json params{
                    {"line", p.line}, {"column", p.column}, {"ty", std::string(toString(p.ty))}};
                return makeEnvelope(name, &params);
            } else if constexpr (std::is_same_v<P, FindNextParams>) {
                json params{{"wrap_around", p.wrapAround}, {"allow_same", p.allowSame}};
                return makeEnvelope(name, &params);
            } else {
                static_assert(std::is_same_v<P, FindPreviousParams>);
                json params{{"wrap_around", p.wrapAround}};
                return makeEnvelope(name, &params);
            }
        },
        params_);
}

// ============================================================================
// EditRequest
// ============================================================================

std::string_view methodName(EditRequestMethod method) {
    return kEditRequestNames[static_cast<std::size_t>(method)];
}

std::optional<EditRequestMethod> parseEditRequestMethod(std::string_view name) {
    for (std::size_t i = 0; i < kEditRequestNames.size(); ++i) {
        if (kEditRequestNames[i] == name) {
            return static_cast<EditRequestMethod>(i);
        }
    }
    return std::nullopt;
}

EditRequest EditRequest::cut() {
    return EditRequest{EditRequestMethod::Cut, std::monostate{}};
}

EditRequest EditRequest::copy() {
    return EditRequest{EditRequestMethod::Copy, std::monostate{}};
}

EditRequest EditRequest::find(std::optional<std::string> chars, bool caseSensitive) {
    return EditRequest{EditRequestMethod::Find, FindParams{std::move(chars), caseSensitive}};
}

Result<EditRequest> EditRequest::fromJson(std::string_view name, const json* params) {
    auto parsed = parseEditRequestMethod(name);
    if (!parsed) {
        return Error::unknownEditMethod(std::string(name));
    }

    switch (*parsed) {
        case EditRequestMethod::Cut:
        case EditRequestMethod::Copy:
            if (!isAbsent(params)) {
                return malformed(name, params, "command takes no parameters");
            }
            return EditRequest{*parsed, std::monostate{}};
        case EditRequestMethod::Find: {
            if (!params) {
                return malformed(name, params);
            }
            auto chars = optionalStringField(*params, "chars");
            auto caseSensitive = boolField(*params, "case_sensitive");
            if (!chars || !caseSensitive) {
                return malformed(name, params);
            }
            return find(std::move(*chars), *caseSensitive);
        }
    }
    return Error::unknownEditMethod(std::string(name));
}

Result<EditRequest> EditRequest::fromJson(const json& envelope) {
    return decodeEnvelope<EditRequest>(envelope);
}

json EditRequest::toJson() const {
    const auto name = methodName(method_);
    if (const auto* findParams = std::get_if<FindParams>(&params_)) {
        json params{{"chars", findParams->chars ? json(*findParams->chars) : json(nullptr)},
                    {"case_sensitive", findParams->caseSensitive}};
        return makeEnvelope(name, &params);
    }
    return makeEnvelope(name, nullptr);
}

} // namespace editrpc::protocol
