#pragma once

#include <nlohmann/json.hpp>

namespace wombat {
using json = nlohmann::json;
} // namespace wombat
