#pragma once

#include <ordered-list/assert.hh>
#include <ordered-list/fwd.hh>
#include <ordered-list/utility.hh>

#include <memory>
#include <type_traits>

/// Tag wrapper marking a payload as the error alternative of a result.
/// Construct via ol::error(e) so that result<int, int>{ol::error(3)} is unambiguous.
template <class E>
struct ol::as_error_t
{
    E value;
};

namespace ol
{
/// Wraps an error value so it converts into the error alternative of any compatible result.
/// Usage: return ol::error(ol::list_error{ol::list_error_kind::read_only});
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return {ol::forward<E>(e)};
}

namespace impl
{
template <class T>
constexpr bool is_as_error = false;
template <class E>
constexpr bool is_as_error<as_error_t<E>> = true;

/// Replaces the live object at `old_obj` by a NewT built from `args` at `new_obj` (both may alias).
/// If building throws, `old_obj` is still alive afterwards.
template <class NewT, class OldT, class... Args>
void reinit_alternative(NewT* new_obj, OldT* old_obj, Args&&... args)
{
    if constexpr (std::is_nothrow_constructible_v<NewT, Args&&...>)
    {
        std::destroy_at(old_obj);
        std::construct_at(new_obj, ol::forward<Args>(args)...);
    }
    else if constexpr (std::is_nothrow_move_constructible_v<NewT>)
    {
        NewT tmp(ol::forward<Args>(args)...);
        std::destroy_at(old_obj);
        std::construct_at(new_obj, ol::move(tmp));
    }
    else
    {
        static_assert(std::is_nothrow_move_constructible_v<OldT>,
                      "result cannot switch alternatives when neither side is nothrow move constructible");
        OldT backup(ol::move(*old_obj));
        std::destroy_at(old_obj);
        try
        {
            std::construct_at(new_obj, ol::forward<Args>(args)...);
        }
        catch (...)
        {
            std::construct_at(old_obj, ol::move(backup));
            throw;
        }
    }
}
} // namespace impl
} // namespace ol

/// Sum type representing either a success value T or an error value E.
/// This is how every fallible ordered_list operation reports expected failures (out of range, read-only, ...).
///
/// A default-constructed result holds a value-initialized error.
/// value() on an error result and error() on a value result are programmer errors and assert.
/// Trivially copyable when both T and E are trivially copyable.
///
/// Usage:
///   auto res = list.item_at(i);
///   if (res.has_error())
///       return ol::error(res.error());
///   use(res.value());
template <class T, class E>
struct ol::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");
    static_assert(!impl::is_as_error<T>, "as_error_t is a construction tag, not a value type");

    // bitwise copy and no destructor when both alternatives allow it
    static constexpr bool is_trivial_storage = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;

    // construction
public:
    /// Holds E{}.
    constexpr result() : _error(), _has_value(false) {}

    /// Holds a value, perfect-forwarded into storage.
    template <class U = std::remove_cv_t<T>>
        requires(std::is_constructible_v<T, U &&> && !impl::is_as_error<std::remove_cvref_t<U>>
                 && !std::is_same_v<std::remove_cvref_t<U>, result>)
    constexpr result(U&& value) : _value(ol::forward<U>(value)), _has_value(true) // NOLINT
    {
    }

    /// Holds an error, moved out of the tag.
    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G> err) : _error(ol::move(err.value)), _has_value(false) // NOLINT
    {
    }

    // trivial copy/move/destroy - defaulted when T and E allow bitwise operations
public:
    result(result&&)
        requires is_trivial_storage
    = default;
    result(result const&)
        requires is_trivial_storage
    = default;
    result& operator=(result&&)
        requires is_trivial_storage
    = default;
    result& operator=(result const&)
        requires is_trivial_storage
    = default;
    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    /// Moves the active alternative. rhs keeps its alternative in a moved-from state.
    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        requires(!is_trivial_storage)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            std::construct_at(&_value, ol::move(rhs._value));
        else
            std::construct_at(&_error, ol::move(rhs._error));
    }

    result(result const& rhs)
        requires(!is_trivial_storage && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            std::construct_at(&_value, rhs._value);
        else
            std::construct_at(&_error, rhs._error);
    }

    result& operator=(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_assignable_v<T>
                                             && std::is_nothrow_move_constructible_v<E> && std::is_nothrow_move_assignable_v<E>)
        requires(!is_trivial_storage)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _value = ol::move(rhs._value);
            else
                emplace_value(ol::move(rhs._value));
        }
        else
        {
            if (_has_value)
                emplace_error(ol::move(rhs._error));
            else
                _error = ol::move(rhs._error);
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivial_storage && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _value = rhs._value;
            else
                emplace_value(rhs._value);
        }
        else
        {
            if (_has_value)
                emplace_error(rhs._error);
            else
                _error = rhs._error;
        }
        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
        impl_destroy();
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Precondition: has_value()
    [[nodiscard]] constexpr T& value() &
    {
        OL_ASSERT(_has_value, "attempted to access value of an error result");
        return _value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        OL_ASSERT(_has_value, "attempted to access value of an error result");
        return _value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        OL_ASSERT(_has_value, "attempted to access value of an error result");
        return ol::move(_value);
    }

    /// Precondition: has_error()
    [[nodiscard]] constexpr E& error() &
    {
        OL_ASSERT(!_has_value, "attempted to access error of a value result");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        OL_ASSERT(!_has_value, "attempted to access error of a value result");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        OL_ASSERT(!_has_value, "attempted to access error of a value result");
        return ol::move(_error);
    }

    /// Returns the value or the fallback when this holds an error.
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return _has_value ? _value : static_cast<T>(ol::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) &&
    {
        return _has_value ? ol::move(_value) : static_cast<T>(ol::forward<U>(fallback));
    }

    /// Returns the error or the fallback when this holds a value.
    template <class G>
    [[nodiscard]] constexpr E error_or(G&& fallback) const&
    {
        return _has_value ? static_cast<E>(ol::forward<G>(fallback)) : _error;
    }
    template <class G>
    [[nodiscard]] constexpr E error_or(G&& fallback) &&
    {
        return _has_value ? static_cast<E>(ol::forward<G>(fallback)) : ol::move(_error);
    }

    // modifiers
public:
    /// Replaces the current alternative by a value constructed from `args`.
    /// If the construction throws, the result keeps its previous alternative.
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        if (_has_value)
            impl::reinit_alternative(&_value, &_value, ol::forward<Args>(args)...);
        else
            impl::reinit_alternative(&_value, &_error, ol::forward<Args>(args)...);
        _has_value = true;
        return _value;
    }

    /// Replaces the current alternative by an error constructed from `args`.
    /// If the construction throws, the result keeps its previous alternative.
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        if (_has_value)
            impl::reinit_alternative(&_error, &_value, ol::forward<Args>(args)...);
        else
            impl::reinit_alternative(&_error, &_error, ol::forward<Args>(args)...);
        _has_value = false;
        return _error;
    }

    // comparison
public:
    /// Equal if both hold equal values or both hold equal errors.
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value ? bool(lhs._value == rhs._value) : bool(lhs._error == rhs._error);
    }

    // helper
private:
    constexpr void impl_destroy()
    {
        if (_has_value)
            std::destroy_at(&_value);
        else
            std::destroy_at(&_error);
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};

/// Either success or an error value E.
/// A default-constructed result<void, E> is a success, so "return {};" reports success.
template <class E>
struct ol::result<void, E>
{
    // construction
public:
    constexpr result() : _has_value(true) {}

    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G> err) : _error(ol::move(err.value)), _has_value(false) // NOLINT
    {
    }

    // copy/move/destroy
public:
    result(result&&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result(result const&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result& operator=(result&&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result& operator=(result const&)
        requires std::is_trivially_copyable_v<E>
    = default;
    ~result()
        requires std::is_trivially_destructible_v<E>
    = default;

    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<E>)
        requires(!std::is_trivially_copyable_v<E>)
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            std::construct_at(&_error, ol::move(rhs._error));
    }
    result(result const& rhs)
        requires(!std::is_trivially_copyable_v<E> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            std::construct_at(&_error, rhs._error);
    }
    result& operator=(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<E>)
        requires(!std::is_trivially_copyable_v<E>)
    {
        if (this == &rhs)
            return *this;
        if (rhs._has_value)
            emplace_value();
        else
            emplace_error(ol::move(rhs._error));
        return *this;
    }
    result& operator=(result const& rhs)
        requires(!std::is_trivially_copyable_v<E> && std::is_copy_constructible_v<E>)
    {
        if (this == &rhs)
            return *this;
        if (rhs._has_value)
            emplace_value();
        else
            emplace_error(rhs._error);
        return *this;
    }
    ~result()
        requires(!std::is_trivially_destructible_v<E>)
    {
        if (!_has_value)
            std::destroy_at(&_error);
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Precondition: has_error()
    [[nodiscard]] constexpr E& error() &
    {
        OL_ASSERT(!_has_value, "attempted to access error of a success result");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        OL_ASSERT(!_has_value, "attempted to access error of a success result");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        OL_ASSERT(!_has_value, "attempted to access error of a success result");
        return ol::move(_error);
    }

    template <class G>
    [[nodiscard]] constexpr E error_or(G&& fallback) const&
    {
        return _has_value ? static_cast<E>(ol::forward<G>(fallback)) : _error;
    }

    // modifiers
public:
    void emplace_value()
    {
        if (!_has_value)
            std::destroy_at(&_error);
        _has_value = true;
    }

    /// If the construction throws, the result keeps its previous state.
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        if (_has_value)
            std::construct_at(&_error, ol::forward<Args>(args)...);
        else
            impl::reinit_alternative(&_error, &_error, ol::forward<Args>(args)...);
        _has_value = false;
        return _error;
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
        requires requires(E const& e) { bool(e == e); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value || bool(lhs._error == rhs._error);
    }

    // members
private:
    union
    {
        char _none;
        E _error;
    };
    bool _has_value;
};
