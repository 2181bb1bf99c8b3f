#pragma once

#include <string>

namespace crawl_sync {

/// What the transfer loop does with a chunk response.
enum class StatusAction {
    Proceed,   // 200: scan and append rows
    Throttle,  // 429: pause, retry, not an error
    Shrink,    // 504: pause, retry, count toward chunk-size shrink
    Retry,     // other 5xx: pause, retry
    Fatal      // abort the session
};

struct StatusClass {
    StatusAction action = StatusAction::Fatal;
    std::string  message;   // user-facing text for Fatal, otherwise a label
};

/// Look up @p httpStatus in the classification table.  Exact codes win over
/// the 4xx / 5xx ranges; anything outside the table is Fatal.
StatusClass classifyStatus(unsigned int httpStatus);

/// Whether @p httpStatus is counted in the session's error counter
/// (every non-200 response except throttling).
bool countsAsError(unsigned int httpStatus);

const char* toString(StatusAction action);

} // namespace crawl_sync
