#pragma once

/// @file game_error.hpp
/// @brief Error type carried by GameResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "dad/foundation/error_code.hpp"

namespace dad::foundation {

/// Error code plus a readable message and optional typed context.
///
/// Validation errors attach the offending UnitType (or BehaviorKind) as
/// context so startup code can report which authoring entry is broken.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    /// Typed context, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Return a copy whose message is prefixed with @p prefix.
    [[nodiscard]] GameError withPrefix(std::string_view prefix) const {
        GameError copy = *this;
        copy.message_ = std::string(prefix) + ": " + message_;
        return copy;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace dad::foundation
