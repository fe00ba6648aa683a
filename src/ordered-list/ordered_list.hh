#pragma once

#include <ordered-list/impl/list_base.hh>


/// Integer-indexed list of T items with an optional one-way read-only lock.
/// Items keep their insertion order and are addressed by zero-based index.
/// Fallible operations report list_error through ol::result instead of throwing.
///
/// Usage:
///   auto list = ol::ordered_list<std::string>{"a", "b"};
///   auto idx = list.add("c");                  // idx.value() == 2
///   auto res = list.insert_before("b", "x");   // ["a", "x", "b", "c"], res.value() == 1
///   (void)list.set_read_only(true);            // fails: seeding already decided the state
///
///   auto locked = ol::ordered_list<int>::create_locked(std::vector{1, 2, 3});
///   locked.add(4).error().kind == ol::list_error_kind::read_only;
///
/// Value semantics: copies and moves carry both the items and the read-only state.
template <class T>
struct ol::ordered_list : private ol::impl::list_base<T, ordered_list<T>>
{
    using base = ol::impl::list_base<T, ordered_list<T>>;

    using typename base::const_iterator;
    using typename base::value_type;

    // queries
public:
    using base::count;     // number of items
    using base::empty;     // check if the list has no items
    using base::exists_at; // check if an index addresses an item
    using base::size;      // same as count

    // read-only state
public:
    using base::is_read_only;  // collapsed lock state, unset reads as false
    using base::read_only;     // raw tri-state
    using base::set_read_only; // lock or unlock once, from outside

    // element access
public:
    using base::operator[]; // unchecked access by index
    using base::item_at;    // checked access by index
    using base::to_array;   // snapshot copy of all items

    // iterators
public:
    using base::begin; // const iterator to the first item
    using base::end;   // const iterator past the last item

    // lookup
public:
    using base::contains; // check if an equal item exists
    using base::index_of; // index of the first equal item, or -1

    // modifiers
public:
    using base::insert_at; // insert at index, shifting later items back
    using base::remove_at; // remove and return the item at index

    using base::add;           // append, returns the new index
    using base::clear;         // remove all items
    using base::insert_after;  // insert right after an existing item
    using base::insert_before; // insert right before an existing item
    using base::remove;        // remove the first equal item, returns its former index
    using base::set_at;        // array-style assignment: append at count, replace below

    using base::copy_from;  // replace contents from a range
    using base::merge_with; // append a range

    // factories
public:
    /// Creates a list holding the items of `items`.
    /// mode == locked locks the list right away, any other mode leaves it explicitly unlocked.
    template <item_range_of<T> R>
    [[nodiscard]] static ordered_list create_from(R&& items, read_only_state mode = read_only_state::unset)
    {
        ordered_list list;
        list.impl_seed(items, mode);
        return list;
    }

    /// Creates a list holding the items of `items` that rejects every mutation.
    template <item_range_of<T> R>
    [[nodiscard]] static ordered_list create_locked(R&& items)
    {
        return create_from(items, read_only_state::locked);
    }

    // ordered_list has deep-copy value semantics
public:
    /// Empty list with an unset read-only state.
    ordered_list() = default;

    /// List holding `items`, explicitly unlocked.
    ordered_list(std::initializer_list<T> items) { this->impl_seed(items, read_only_state::unlocked); }

    ~ordered_list() = default;
    ordered_list(ordered_list&&) = default;
    ordered_list& operator=(ordered_list&&) = default;
    ordered_list(ordered_list const&) = default;
    ordered_list& operator=(ordered_list const&) = default;

    friend base;
};
