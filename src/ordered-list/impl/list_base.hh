#pragma once

#include <ordered-list/assert.hh>
#include <ordered-list/list_error.hh>
#include <ordered-list/read_only.hh>
#include <ordered-list/result.hh>
#include <ordered-list/utility.hh>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <ranges>
#include <type_traits>
#include <vector>

namespace ol
{
/// Anything copy_from / merge_with / create_from accept: an input range whose elements convert to T.
/// Passing something that is not such a range is rejected at compile time.
template <class R, class T>
concept item_range_of = std::ranges::input_range<R> && std::convertible_to<std::ranges::range_reference_t<R>, T>;
} // namespace ol

/// Mixin implementing the full "ordered, indexable, mutable-until-locked list" surface.
///
/// This is a CRTP-style helper: concrete lists inherit it as `ol::impl::list_base<T, Derived>`.
/// Example (abridged):
///
///     template <class T>
///     struct ol::ordered_list : private ol::impl::list_base<T, ordered_list<T>> {
///         using base = ol::impl::list_base<T, ordered_list<T>>;
///         using base::add;
///         using base::item_at;
///         // ...
///         friend base;
///     };
///
/// There are exactly two structural primitives, insert_at and remove_at.
/// Every composite operation (add, remove, clear, insert_before, insert_after, set_at, copy_from, merge_with)
/// is expressed through `Derived::insert_at` / `Derived::remove_at`.
/// A derived list can therefore shadow these two members (and call the base versions) to observe
/// or veto every structural change:
///
///     struct observed_list : ol::impl::list_base<int, observed_list> {
///         using base = ol::impl::list_base<int, observed_list>;
///         ol::result<void, ol::list_error> insert_at(ol::isize i, int v) {
///             auto res = base::insert_at(i, v);
///             if (res.has_value()) notify_inserted(i);
///             return res;
///         }
///     };
///
/// === Read-only lock ===
///
/// Every mutating operation first collapses an unset read-only state to unlocked
/// and then fails with list_error_kind::read_only if the list is locked.
/// The external setter set_read_only succeeds only while the state is still unset.
/// Derived lists use set_read_only_internal to change the state at any time.
///
/// === Failure guarantees ===
///
/// A failing operation leaves the items unchanged.
/// clear, copy_from and merge_with check the lock up front, so on a locked list they fail even if there is nothing to do.
/// copy_from and merge_with snapshot their input before the first structural change,
/// which makes them safe to call with the list itself (or a view of it) as input.
///
/// Items are compared with T's operator== (identity for pointer items).
template <class T, class DerivedT>
struct ol::impl::list_base
{
    static_assert(!std::is_same_v<T, bool>, "std::vector<bool> proxies cannot be handed out as T const&");
    static_assert(std::is_copy_constructible_v<T>, "list items are copied by item_at, to_array and copy_from");

    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    // queries
public:
    /// Number of items in the list.
    [[nodiscard]] isize count() const { return isize(_items.size()); }
    /// Same as count(), for use as a sized range.
    [[nodiscard]] isize size() const { return isize(_items.size()); }
    [[nodiscard]] bool empty() const { return _items.empty(); }

    /// True if 0 <= index < count().
    [[nodiscard]] bool exists_at(isize index) const { return 0 <= index && index < count(); }

    // read-only state
public:
    /// Collapsed view of the read-only state: an unset state reads as false.
    [[nodiscard]] bool is_read_only() const { return _read_only.is_locked(); }

    /// The raw tri-state, including unset.
    [[nodiscard]] read_only_state read_only() const { return _read_only.state(); }

    /// Locks or explicitly unlocks the list.
    /// Allowed once, and only while no mutation has collapsed the state yet.
    /// Fails with list_error_kind::invalid_operation otherwise.
    [[nodiscard]] result<void, list_error> set_read_only(bool read_only) { return _read_only.set(read_only); }

    // element access
public:
    /// Unchecked access.
    /// Precondition: 0 <= i < count().
    [[nodiscard]] T const& operator[](isize i) const
    {
        OL_ASSERT(0 <= i && i < count(), "index out of bounds");
        return _items[std::size_t(i)];
    }

    /// Checked access, returns a copy of the item.
    [[nodiscard]] result<T, list_error> item_at(isize index) const
    {
        if (!exists_at(index))
            return ol::error(list_error::index_out_of_range(index));

        return _items[std::size_t(index)];
    }

    /// Snapshot of the current items in order. Later mutations do not affect it.
    [[nodiscard]] std::vector<T> to_array() const { return _items; }

    // iterators
public:
    // const only: writing through an iterator would bypass the read-only lock
    [[nodiscard]] const_iterator begin() const { return _items.begin(); }
    [[nodiscard]] const_iterator end() const { return _items.end(); }

    // lookup
public:
    /// Index of the first item equal to `item`, or -1.
    [[nodiscard]] isize index_of(T const& item) const
    {
        auto const it = std::find(_items.begin(), _items.end(), item);
        return it == _items.end() ? -1 : isize(it - _items.begin());
    }

    [[nodiscard]] bool contains(T const& item) const { return index_of(item) != -1; }

    // structural primitives
public:
    /// Inserts `item` so that it ends up at `index`. Items at and after `index` move one position back.
    /// 0 <= index <= count() is required, index == count() appends.
    [[nodiscard]] result<void, list_error> insert_at(isize index, T item)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());
        if (index < 0 || index > count())
            return ol::error(list_error::index_out_of_range(index));

        if (index == count())
            _items.push_back(ol::move(item));
        else
            _items.insert(_items.begin() + index, ol::move(item));

        return {};
    }

    /// Removes and returns the item at `index`. Later items move one position forward.
    [[nodiscard]] result<T, list_error> remove_at(isize index)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());
        if (!exists_at(index))
            return ol::error(list_error::index_out_of_range(index));

        auto const it = _items.begin() + index;
        T item = ol::move(*it);
        _items.erase(it);
        return ol::move(item);
    }

    // composite modifiers
public:
    /// Appends `item` and returns its index.
    [[nodiscard]] result<isize, list_error> add(T item)
    {
        auto res = derived().insert_at(count(), ol::move(item));
        if (res.has_error())
            return ol::error(res.error());

        return count() - 1;
    }

    /// Removes the first item equal to `item` and returns the index it had.
    [[nodiscard]] result<isize, list_error> remove(T const& item)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        auto const index = index_of(item);
        if (index < 0)
            return ol::error(list_error::item_not_found());

        auto res = derived().remove_at(index);
        if (res.has_error())
            return ol::error(res.error());

        return index;
    }

    /// Removes all items, one remove_at per item from the highest index down.
    [[nodiscard]] result<void, list_error> clear()
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        for (auto i = count() - 1; i >= 0; --i)
        {
            auto res = derived().remove_at(i);
            if (res.has_error())
                return ol::error(res.error());
        }

        return {};
    }

    /// Inserts `item` right before the first occurrence of `base_item` and returns the insertion index.
    [[nodiscard]] result<isize, list_error> insert_before(T const& base_item, T item)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        auto const index = index_of(base_item);
        if (index < 0)
            return ol::error(list_error::item_not_found());

        auto res = derived().insert_at(index, ol::move(item));
        if (res.has_error())
            return ol::error(res.error());

        return index;
    }

    /// Inserts `item` right after the first occurrence of `base_item` and returns the insertion index.
    [[nodiscard]] result<isize, list_error> insert_after(T const& base_item, T item)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        auto const index = index_of(base_item);
        if (index < 0)
            return ol::error(list_error::item_not_found());

        auto res = derived().insert_at(index + 1, ol::move(item));
        if (res.has_error())
            return ol::error(res.error());

        return index + 1;
    }

    /// Array-style assignment.
    /// index == count() appends, 0 <= index < count() replaces the item at index.
    /// Replacement is a remove_at followed by an insert_at at the same index, so derived lists see both.
    [[nodiscard]] result<void, list_error> set_at(isize index, T item)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        if (index == count())
            return derived().insert_at(index, ol::move(item));

        if (!exists_at(index))
            return ol::error(list_error::index_out_of_range(index));

        auto removed = derived().remove_at(index);
        if (removed.has_error())
            return ol::error(removed.error());

        return derived().insert_at(index, ol::move(item));
    }

    // bulk modifiers
public:
    /// Replaces the contents with the items of `items`, in order.
    template <item_range_of<T> R>
    [[nodiscard]] result<void, list_error> copy_from(R&& items)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        auto incoming = impl_snapshot(items);

        if (!empty())
        {
            auto res = clear();
            if (res.has_error())
                return res;
        }

        return impl_append_all(incoming);
    }
    [[nodiscard]] result<void, list_error> copy_from(std::initializer_list<T> items)
    {
        return copy_from<std::initializer_list<T>>(ol::move(items));
    }
    /// No data: nothing is cleared and nothing is checked.
    [[nodiscard]] result<void, list_error> copy_from(nullptr_t) { return {}; }

    /// Appends the items of `items`, in order.
    template <item_range_of<T> R>
    [[nodiscard]] result<void, list_error> merge_with(R&& items)
    {
        _read_only.collapse();
        if (_read_only.is_locked())
            return ol::error(list_error::read_only());

        auto incoming = impl_snapshot(items);
        return impl_append_all(incoming);
    }
    [[nodiscard]] result<void, list_error> merge_with(std::initializer_list<T> items)
    {
        return merge_with<std::initializer_list<T>>(ol::move(items));
    }
    /// No data: nothing is appended and nothing is checked.
    [[nodiscard]] result<void, list_error> merge_with(nullptr_t) { return {}; }

    // derived-type access
protected:
    /// Changes the read-only state regardless of whether it was already decided.
    void set_read_only_internal(bool read_only) { _read_only.force(read_only); }

    /// Fills a freshly constructed list and decides its read-only state.
    /// Seeding counts as a mutation, so an unset mode ends up unlocked.
    template <class R>
    void impl_seed(R&& items, read_only_state mode)
    {
        _read_only.collapse();
        for (auto&& item : items)
            _items.push_back(T(ol::forward<decltype(item)>(item)));
        _read_only.force(mode == read_only_state::locked);
    }

    list_base() = default;
    ~list_base() = default;
    list_base(list_base&&) = default;
    list_base& operator=(list_base&&) = default;
    list_base(list_base const&) = default;
    list_base& operator=(list_base const&) = default;

    // helper
private:
    DerivedT& derived() { return static_cast<DerivedT&>(*this); }

    template <class R>
    static std::vector<T> impl_snapshot(R& items)
    {
        std::vector<T> snapshot;
        if constexpr (std::ranges::sized_range<R>)
            snapshot.reserve(std::size_t(std::ranges::size(items)));
        for (auto&& item : items)
            snapshot.push_back(T(ol::forward<decltype(item)>(item)));
        return snapshot;
    }

    result<void, list_error> impl_append_all(std::vector<T>& incoming)
    {
        for (auto& item : incoming)
        {
            auto res = derived().add(ol::move(item));
            if (res.has_error())
                return ol::error(res.error());
        }
        return {};
    }

    // members
private:
    std::vector<T> _items;
    read_only_flag _read_only;
};
