#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "lumen/value.hpp"

namespace lumen {

std::optional<value> read_str(std::string_view source);
std::vector<value> read_all(std::string_view source);

}  // namespace lumen
