#ifndef __BTLINK_JSON_LIB__
#define __BTLINK_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Message metadata, filter configs and statistics snapshots are all
 * `nlohmann::json` values.
 */
using json = nlohmann::json;

#endif  // __BTLINK_JSON_LIB__
