#pragma once

#include <cstddef>
#include <cstdint>


namespace ol
{

//
// Primitives
//

// signed integers
using i32 = int32_t;
using i64 = int64_t;

// signed size type
// Sizes and indices are signed so that "count - 1" on an empty list stays meaningful
// and -1 can serve as the "not found" sentinel of index_of.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Errors
//

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

enum class list_error_kind : i32;
struct list_error;

//
// Container
//

enum class read_only_state : i32;
struct read_only_flag;

namespace impl
{
template <class T, class DerivedT>
struct list_base;
}

template <class T>
struct ordered_list;

} // namespace ol
