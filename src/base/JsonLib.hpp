#ifndef __TT_JSON_LIB__
#define __TT_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Layout and tab state dumps are built with `nlohmann::json`.
 */
using json = nlohmann::json;

namespace tt {
/** @brief Serializes a state dump, indented when `pretty` is set. */
inline std::string dumpJson(const json &j, bool pretty) {
  return pretty ? j.dump(2) : j.dump();
}
}  // namespace tt

#endif  // __TT_JSON_LIB__
