#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for the panel state dump.
 */
using json = nlohmann::json;
