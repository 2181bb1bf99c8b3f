#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace crawl_sync {

/// "chunk" object of the JSON count probe: { "chunk": { total, page, size } }.
struct ChunkEnvelope {
    std::int64_t total = 0;
    int          page  = 0;
    int          size  = 0;
};

/// Longest row accepted from a TSV chunk (a line scanner's token limit).
constexpr std::size_t kMaxRowBytes = 1024 * 1024;

/// Parse the JSON count-probe body.
/// Throws std::runtime_error if the expected shape is missing or negative.
ChunkEnvelope parseChunkEnvelope(const nlohmann::json& responseBody);

/// Convenience overload for the raw body text.
ChunkEnvelope parseChunkEnvelope(const std::string& rawBody);

/// Split a TSV body into rows.  Rows end at '\n'; a trailing '\r' is
/// dropped; a final unterminated row counts; a trailing newline does not
/// produce an empty row.
/// Throws std::runtime_error if a row exceeds kMaxRowBytes.
std::vector<std::string> splitRows(const std::string& body);

} // namespace crawl_sync
