#pragma once

#include <source_location>

namespace ol
{
/// Type alias for std::source_location
/// Used by assertion failures to report file, line, column and function
using source_location = std::source_location;
} // namespace ol
