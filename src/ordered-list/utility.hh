#pragma once

#include <ordered-list/macros.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//

namespace ol
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   list.add(ol::move(item));      // transfer item into the list
template <class T>
[[nodiscard]] OL_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for lvalues
template <class T>
[[nodiscard]] OL_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for rvalues
template <class T>
[[nodiscard]] OL_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept
{
    return static_cast<T&&>(value);
}
} // namespace ol
