#pragma once

#include <source_location>

namespace sv
{
/// Source position captured by the assertion macros (file, line, column, function)
using source_location = std::source_location;
} // namespace sv
