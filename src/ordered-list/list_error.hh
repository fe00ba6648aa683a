#pragma once

#include <ordered-list/fwd.hh>

#include <string>

/// Why an ordered_list operation was rejected.
/// A rejected operation never changes the items of the list.
enum class ol::list_error_kind : ol::i32
{
    /// Index outside [0, count) for reads and removals, outside [0, count] for insertions.
    index_out_of_range,
    /// A lookup-by-item (remove, insert_before, insert_after) did not find the item.
    item_not_found,
    /// Bulk input that is not a range of items.
    /// No ordered_list operation returns this: copy_from, merge_with and create_from reject such input
    /// at compile time (see ol::item_range_of). Reserved for callers that type-erase their input
    /// and forward the failure as a list_error.
    invalid_data_type,
    /// A mutating operation on a locked list.
    read_only,
    /// set_read_only after the read-only state already left "unset".
    invalid_operation,
};

/// Error payload of every fallible ordered_list operation.
struct ol::list_error
{
    list_error_kind kind = list_error_kind::invalid_operation;

    /// the rejected index for index_out_of_range, -1 otherwise
    isize index = -1;

    [[nodiscard]] static constexpr list_error index_out_of_range(isize index)
    {
        return {list_error_kind::index_out_of_range, index};
    }
    [[nodiscard]] static constexpr list_error item_not_found() { return {list_error_kind::item_not_found, -1}; }
    [[nodiscard]] static constexpr list_error read_only() { return {list_error_kind::read_only, -1}; }
    [[nodiscard]] static constexpr list_error invalid_operation() { return {list_error_kind::invalid_operation, -1}; }

    friend constexpr bool operator==(list_error const&, list_error const&) = default;
};

namespace ol
{
// stable message key, e.g. "list_index_invalid"
[[nodiscard]] char const* to_string(list_error_kind kind);

// human-readable message, e.g. "list index 4 is out of range"
[[nodiscard]] std::string to_string(list_error const& error);
} // namespace ol
