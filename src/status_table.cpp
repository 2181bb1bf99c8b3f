#include "status_table.hpp"

#include <map>

namespace crawl_sync {

namespace {

const std::map<unsigned int, StatusClass>& exactCodes() {
    static const std::map<unsigned int, StatusClass> table = {
        {200, {StatusAction::Proceed,  "ok"}},
        {403, {StatusAction::Fatal,    "Access denied. Wrong credentials?"}},
        {404, {StatusAction::Fatal,    "Not found. Correct crawl ID?"}},
        {429, {StatusAction::Throttle, "throttled"}},
        {504, {StatusAction::Shrink,   "gateway timeout"}},
    };
    return table;
}

} // namespace

StatusClass classifyStatus(unsigned int httpStatus) {
    const auto& table = exactCodes();
    auto it = table.find(httpStatus);
    if (it != table.end()) {
        return it->second;
    }

    if (httpStatus >= 400 && httpStatus < 500) {
        return {StatusAction::Fatal,
                "Unknown error occurred (code " + std::to_string(httpStatus) + ")."};
    }
    if (httpStatus >= 500 && httpStatus < 600) {
        return {StatusAction::Retry, "server error"};
    }
    return {StatusAction::Fatal,
            "Unexpected response (code " + std::to_string(httpStatus) + ")."};
}

bool countsAsError(unsigned int httpStatus) {
    return httpStatus != 200 && httpStatus != 429;
}

const char* toString(StatusAction action) {
    switch (action) {
        case StatusAction::Proceed:  return "proceed";
        case StatusAction::Throttle: return "throttle";
        case StatusAction::Shrink:   return "shrink";
        case StatusAction::Retry:    return "retry";
        case StatusAction::Fatal:    return "fatal";
    }
    return "unknown";
}

} // namespace crawl_sync
