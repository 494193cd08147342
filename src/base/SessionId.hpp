#ifndef __TT_SESSION_ID__
#define __TT_SESSION_ID__

#include <stdint.h>

namespace tt {
/** @brief Opaque session identifier handed out by the TabManager; never
 * reused while the manager is alive. */
typedef uint64_t SessionId;
}  // namespace tt

#endif  // __TT_SESSION_ID__
