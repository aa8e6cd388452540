#pragma once

#include <string>

#include "lumen/value.hpp"

namespace lumen {

std::string print_str(value v, bool readable);
std::string print_value(value v);
std::string write_value(value v);

}  // namespace lumen
