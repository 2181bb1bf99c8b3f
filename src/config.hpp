#pragma once

#include <cstdint>
#include <string>

namespace crawl_sync {

struct Config {
    std::string   username;
    std::string   password;
    std::uint64_t crawlId   = 0;
    bool          details   = true;     // --no-details clears it
    std::string   output;               // empty: stdout
    bool          resume    = true;     // --no-resume clears it
    std::string   endpoint  = "https://api.audisto.com";
    std::int64_t  chunkSize = 10000;
    int           timeoutMs = 120000;
    bool          verbose   = false;
    bool          showHelp  = false;
};

/// Parse argv.  String values are whitespace-trimmed.
/// @throws std::invalid_argument on unknown flags, missing values or
///         malformed numbers.
Config parseArgs(int argc, const char* const argv[]);

/// Username, password and crawl id are all present.
bool hasRequiredFields(const Config& cfg);

std::string usageText();

} // namespace crawl_sync
