//! # Common Definitions
//!
//! Types shared by every exprc component: version constants, the `Result`
//! type used for recoverable per-expression failures, smart pointer aliases,
//! and the exception type reserved for internal compiler defects.
//!
//! ## Error Philosophy
//!
//! - **Per-expression errors** (`ParseInputError`, `UnsupportedConstruct`) are
//!   returned through `Result<T, E>` and recovered by the registry as fallbacks.
//! - **Internal defects** (pass ordering violations, dedup name collisions) are
//!   thrown as `InternalCompilerError` and abort the batch.

#ifndef EXPRC_COMMON_HPP
#define EXPRC_COMMON_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace exprc {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A value or an error.
///
/// ```cpp
/// auto result = load_node(json);
/// if (is_err(result)) {
///     return unwrap_err(result).message;
/// }
/// Node& node = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Internal Compiler Errors
// ============================================================================

/// Defects inside the compiler itself. Never recovered per expression.
enum class InternalErrorKind {
    PrecedenceInvariantViolation, ///< Passes observed out of (tier, binding power) order
    DuplicateNameCollision,       ///< Two different normalized trees mapped to one name
};

[[nodiscard]] inline auto internal_error_kind_name(InternalErrorKind kind) -> const char* {
    switch (kind) {
    case InternalErrorKind::PrecedenceInvariantViolation:
        return "PrecedenceInvariantViolation";
    case InternalErrorKind::DuplicateNameCollision:
        return "DuplicateNameCollision";
    }
    return "Unknown";
}

/// Thrown when continuing would silently emit wrong code.
class InternalCompilerError : public std::runtime_error {
public:
    InternalCompilerError(InternalErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(internal_error_kind_name(kind)) + ": " + message),
          kind_(kind) {}

    [[nodiscard]] auto kind() const -> InternalErrorKind {
        return kind_;
    }

private:
    InternalErrorKind kind_;
};

} // namespace exprc

#endif // EXPRC_COMMON_HPP
