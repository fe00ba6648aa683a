#pragma once

#include <ordered-list/fwd.hh>
#include <ordered-list/list_error.hh>
#include <ordered-list/result.hh>

/// Read-only state of a list.
/// Starts as unset and leaves it exactly once, either through an explicit set or through collapse.
enum class ol::read_only_state : ol::i32
{
    unset,    // never decided, behaves like unlocked
    unlocked, // explicitly mutable
    locked,   // no further structural changes
};

/// One-way mutability switch with a guarded external setter.
///
/// Transitions:
///   unset -> unlocked | locked   via set(bool), allowed exactly once
///   unset -> unlocked            via collapse(), silently, before every mutation
///   any   -> unlocked | locked   via force(bool), reserved for the owning list and its derived types
///
/// Once the state has left unset, set(bool) fails with list_error_kind::invalid_operation.
struct ol::read_only_flag
{
    constexpr read_only_flag() = default;
    explicit constexpr read_only_flag(read_only_state state) : _state(state) {}

    [[nodiscard]] constexpr read_only_state state() const { return _state; }

    /// true if locked, unset reads as false
    [[nodiscard]] constexpr bool is_locked() const { return _state == read_only_state::locked; }

    /// true once the state left unset
    [[nodiscard]] constexpr bool is_decided() const { return _state != read_only_state::unset; }

    [[nodiscard]] constexpr result<void, list_error> set(bool read_only)
    {
        if (is_decided())
            return ol::error(list_error::invalid_operation());

        force(read_only);
        return {};
    }

    constexpr void force(bool read_only) { _state = read_only ? read_only_state::locked : read_only_state::unlocked; }

    constexpr void collapse()
    {
        if (_state == read_only_state::unset)
            _state = read_only_state::unlocked;
    }

private:
    read_only_state _state = read_only_state::unset;
};
