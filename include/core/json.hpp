#pragma once

#include <nlohmann/json.hpp>

namespace dbgate {

// Insertion-ordered so canonical rows keep the column order of the result set
using Json = nlohmann::ordered_json;

} // namespace dbgate
