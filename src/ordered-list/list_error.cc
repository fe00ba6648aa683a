#include "list_error.hh"

#include <ordered-list/assert.hh>

char const* ol::to_string(list_error_kind kind)
{
    switch (kind)
    {
    case list_error_kind::index_out_of_range:
        return "list_index_invalid";
    case list_error_kind::item_not_found:
        return "list_item_inexistent";
    case list_error_kind::invalid_data_type:
        return "list_data_not_iterable";
    case list_error_kind::read_only:
        return "list_readonly";
    case list_error_kind::invalid_operation:
        return "list_readonly_set";
    }

    OL_ASSERT_ALWAYS(false, "unknown list_error_kind");
    return "";
}

std::string ol::to_string(list_error const& error)
{
    std::string result = to_string(error.kind);
    result += ": ";

    switch (error.kind)
    {
    case list_error_kind::index_out_of_range:
        result += "list index ";
        result += std::to_string(error.index);
        result += " is out of range";
        break;
    case list_error_kind::item_not_found:
        result += "the item cannot be found in the list";
        break;
    case list_error_kind::invalid_data_type:
        result += "list data must be a range of items";
        break;
    case list_error_kind::read_only:
        result += "the list is read-only and cannot be modified";
        break;
    case list_error_kind::invalid_operation:
        result += "the read-only state of the list has already been set";
        break;
    }

    return result;
}
