#ifndef __MCPV_JSON_LIB__
#define __MCPV_JSON_LIB__

#include <nlohmann/json.hpp>

/**
 * @brief Exposes `nlohmann::json` as `json` for the wire and type layers.
 */
using json = nlohmann::json;

#endif  // __MCPV_JSON_LIB__
