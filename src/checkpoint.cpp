#include "checkpoint.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace crawl_sync {

void validate(const Checkpoint& checkpoint) {
    if (checkpoint.chunkSize <= 0) {
        throw std::invalid_argument("chunkSize must be positive, got " +
                                    std::to_string(checkpoint.chunkSize));
    }
    if (checkpoint.doneElements < 0 ||
        checkpoint.doneElements > checkpoint.totalElements) {
        throw std::invalid_argument(
            "doneElements " + std::to_string(checkpoint.doneElements) +
            " outside [0, " + std::to_string(checkpoint.totalElements) + "]");
    }
}

void to_json(nlohmann::json& j, const Checkpoint& checkpoint) {
    j = nlohmann::json{
        {"outputFilename", checkpoint.outputFilename},
        {"doneElements",   checkpoint.doneElements},
        {"totalElements",  checkpoint.totalElements},
        {"noDetails",      checkpoint.noDetails},
        {"chunkSize",      checkpoint.chunkSize},
    };
}

void from_json(const nlohmann::json& j, Checkpoint& checkpoint) {
    j.at("outputFilename").get_to(checkpoint.outputFilename);
    j.at("doneElements").get_to(checkpoint.doneElements);
    j.at("totalElements").get_to(checkpoint.totalElements);
    j.at("noDetails").get_to(checkpoint.noDetails);

    // Older sidecars carry no chunk size.
    checkpoint.chunkSize = kDefaultChunkSize;
    if (j.contains("chunkSize") && j["chunkSize"].is_number_integer()) {
        const auto stored = j["chunkSize"].get<std::int64_t>();
        if (stored > 0) {
            checkpoint.chunkSize = stored;
        }
    }
}

// ---------------------------------------------------------------------------
// CheckpointStore
// ---------------------------------------------------------------------------

CheckpointStore::CheckpointStore(std::string outputPath)
    : mPath(sidecarPathFor(outputPath)) {}

std::string CheckpointStore::sidecarPathFor(const std::string& outputPath) {
    return outputPath + kSuffix;
}

bool CheckpointStore::exists() const {
    std::error_code ec;
    return fs::exists(mPath, ec);
}

std::optional<Checkpoint> CheckpointStore::load() const {
    if (!exists()) {
        return std::nullopt;
    }

    std::ifstream in(mPath);
    if (!in) {
        throw CheckpointError("Resumer file error: cannot open " + mPath);
    }
    std::stringstream content;
    content << in.rdbuf();

    Checkpoint checkpoint;
    try {
        checkpoint = nlohmann::json::parse(content.str()).get<Checkpoint>();
    } catch (const nlohmann::json::exception& e) {
        throw CheckpointError("Resumer file error: " + mPath + ": " + e.what());
    }

    try {
        validate(checkpoint);
    } catch (const std::invalid_argument& e) {
        throw CheckpointError("Resumer file error: " + mPath + ": " + e.what());
    }
    return checkpoint;
}

void CheckpointStore::save(const Checkpoint& checkpoint) const {
    const std::string tmpPath = mPath + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            throw CheckpointError("Cannot write resumer file " + tmpPath);
        }
        out << nlohmann::json(checkpoint).dump(1, '\t') << "\n";
        out.flush();
        if (!out) {
            throw CheckpointError("Cannot write resumer file " + tmpPath);
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, mPath, ec);
    if (ec) {
        throw CheckpointError("Cannot replace resumer file " + mPath + ": " +
                              ec.message());
    }
}

void CheckpointStore::remove() const {
    std::error_code ec;
    fs::remove(mPath, ec);
    if (ec) {
        throw CheckpointError("Cannot remove resumer file " + mPath + ": " +
                              ec.message());
    }
}

} // namespace crawl_sync
