#include "mapping.hpp"

#include <stdexcept>

namespace crawl_sync {

ChunkEnvelope parseChunkEnvelope(const nlohmann::json& responseBody) {
    if (!responseBody.is_object() || !responseBody.contains("chunk")) {
        throw std::runtime_error("Response missing 'chunk' field");
    }

    const auto& chunk = responseBody["chunk"];
    if (!chunk.is_object()) {
        throw std::runtime_error("Response field 'chunk' is not an object");
    }
    if (!chunk.contains("total") || !chunk["total"].is_number_integer()) {
        throw std::runtime_error("Response missing 'chunk.total' field");
    }

    ChunkEnvelope envelope;
    try {
        envelope.total = chunk["total"].get<std::int64_t>();
        envelope.page  = chunk.value("page", 0);
        envelope.size  = chunk.value("size", 0);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed 'chunk' field: ") + e.what());
    }

    if (envelope.total < 0) {
        throw std::runtime_error("Response 'chunk.total' is negative: " +
                                 std::to_string(envelope.total));
    }
    return envelope;
}

ChunkEnvelope parseChunkEnvelope(const std::string& rawBody) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(rawBody);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse JSON response: ") + e.what());
    }
    return parseChunkEnvelope(body);
}

std::vector<std::string> splitRows(const std::string& body) {
    std::vector<std::string> rows;

    std::size_t start = 0;
    while (start < body.size()) {
        auto end = body.find('\n', start);
        if (end == std::string::npos) {
            end = body.size();
        }

        std::size_t length = end - start;
        if (length > 0 && body[start + length - 1] == '\r') {
            --length;
        }
        if (length > kMaxRowBytes) {
            throw std::runtime_error("Row " + std::to_string(rows.size() + 1) +
                                     " exceeds " + std::to_string(kMaxRowBytes) +
                                     " bytes");
        }

        rows.emplace_back(body, start, length);
        start = end + 1;
    }
    return rows;
}

} // namespace crawl_sync
