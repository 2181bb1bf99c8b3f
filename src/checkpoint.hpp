#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace crawl_sync {

/// Chunk size used when a session starts or a sidecar does not carry one.
constexpr std::int64_t kDefaultChunkSize = 10000;

/// Progress of one output file.
struct Checkpoint {
    std::string  outputFilename;
    std::int64_t chunkSize     = kDefaultChunkSize;
    std::int64_t doneElements  = 0;
    std::int64_t totalElements = 0;
    bool         noDetails     = false;

    bool complete() const { return doneElements == totalElements; }
};

/// Throws std::invalid_argument when an invariant does not hold
/// (0 <= done <= total, chunkSize > 0).
void validate(const Checkpoint& checkpoint);

void to_json(nlohmann::json& j, const Checkpoint& checkpoint);
void from_json(const nlohmann::json& j, Checkpoint& checkpoint);

/// Raised when a sidecar cannot be read, parsed or written.
class CheckpointError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// JSON sidecar stored next to the output file.
class CheckpointStore {
public:
    /// Suffix appended to the output path.
    static constexpr const char* kSuffix = ".audisto_";

    explicit CheckpointStore(std::string outputPath);

    static std::string sidecarPathFor(const std::string& outputPath);

    const std::string& path() const { return mPath; }

    bool exists() const;

    /// std::nullopt when no sidecar exists.
    /// @throws CheckpointError on unreadable or corrupt content.
    std::optional<Checkpoint> load() const;

    /// Write to "<sidecar>.tmp" and rename over the sidecar.
    /// @throws CheckpointError on any filesystem failure.
    void save(const Checkpoint& checkpoint) const;

    /// Delete the sidecar; a missing file is not an error.
    /// @throws CheckpointError if the file exists and cannot be removed.
    void remove() const;

private:
    std::string mPath;
};

} // namespace crawl_sync
