#pragma once

#include <ordered-list/macros.hh>
#include <ordered-list/source_location.hh>

#include <functional>
#include <string>

namespace ol::impl
{
// Replaceable reaction to a failed OL_ASSERT / OL_ASSERT_ALWAYS
// NOTE: the handler stack is global and not synchronized
//
// The topmost handler runs first and only. Without any handler, the failure is written to stderr.
// Returning from a handler still aborts. Throwing from it unwinds instead,
// which is how tests observe precondition violations such as an out-of-bounds list[i]:
//
//   {
//       auto handler = ol::impl::scoped_assertion_handler([](ol::impl::assertion_info const& info) {
//           throw std::logic_error(ol::impl::to_string(info));
//       });
//
//       (void)list[list.count()]; // throws instead of aborting
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    ol::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// Multi-line diagnostic as printed by the default handler:
//
//   Assertion failed: 0 <= i && i < count()
//     Message: index out of bounds
//     Location: list_base.hh:104:9 (operator[])
[[nodiscard]] std::string to_string(assertion_info const& info);

// Makes `handler` the active handler until the matching pop
void push_assertion_handler(assertion_handler handler);

// Reactivates the previous handler (or the stderr default), no-op on an empty stack
// NOTE: prefer scoped_assertion_handler, a throwing handler otherwise makes it easy to miss a pop
void pop_assertion_handler();

// Pushes in the constructor, pops in the destructor
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ol::impl
