#include "config.hpp"
#include "util.hpp"

#include <limits>
#include <stdexcept>

namespace crawl_sync {

namespace {

template <typename T>
T parseNumber(const std::string& flag, const std::string& text, T minimum) {
    const std::string value = trim(text);
    std::size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + text + "'");
    }
    if (used != value.size() || parsed < static_cast<long long>(minimum) ||
        static_cast<unsigned long long>(parsed) >
            static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + text + "'");
    }
    return static_cast<T>(parsed);
}

} // namespace

Config parseArgs(int argc, const char* const argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--username" && hasValue) {
            cfg.username = trim(argv[++i]);
        } else if (arg == "--password" && hasValue) {
            cfg.password = trim(argv[++i]);
        } else if (arg == "--crawl" && hasValue) {
            cfg.crawlId = parseNumber<std::uint64_t>(arg, argv[++i], 1);
        } else if (arg == "--output" && hasValue) {
            cfg.output = trim(argv[++i]);
        } else if (arg == "--endpoint" && hasValue) {
            cfg.endpoint = trim(argv[++i]);
        } else if (arg == "--chunk-size" && hasValue) {
            cfg.chunkSize = parseNumber<std::int64_t>(arg, argv[++i], 1);
        } else if (arg == "--timeout-ms" && hasValue) {
            cfg.timeoutMs = parseNumber<int>(arg, argv[++i], 1);
        } else if (arg == "--no-details") {
            cfg.details = false;
        } else if (arg == "--no-resume") {
            cfg.resume = false;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cfg;
}

bool hasRequiredFields(const Config& cfg) {
    return !cfg.username.empty() && !cfg.password.empty() && cfg.crawlId != 0;
}

std::string usageText() {
    return
        "Usage: crawl_sync [options]\n\n"
        "Options:\n"
        "  --username U     API username                      (required)\n"
        "  --password P     API password                      (required)\n"
        "  --crawl ID       ID of the crawl to download       (required)\n"
        "  --no-details     Request deep=0 instead of deep=1\n"
        "  --output PATH    Output file; rows go to stdout when omitted\n"
        "  --no-resume      Start a new download instead of resuming\n"
        "  --endpoint URL   API base URL     (default: https://api.audisto.com)\n"
        "  --chunk-size N   Initial rows per request         (default: 10000)\n"
        "  --timeout-ms N   HTTP timeout in ms               (default: 120000)\n"
        "  --verbose        Enable verbose diagnostics\n"
        "  --help, -h       Show this message\n";
}

} // namespace crawl_sync
