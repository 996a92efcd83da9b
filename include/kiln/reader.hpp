// Text reader for forms (front end used by the driver and the tests).
#pragma once
#include "kiln/form.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kiln {

// Read exactly one form. Throws parse_error on malformed or trailing input.
node_ptr read(std::string_view src, const std::string& source = "<input>");

// Read every top-level form of a source file.
std::vector<node_ptr> read_all(std::string_view src, const std::string& source = "<input>");

} // namespace kiln
