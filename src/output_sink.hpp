#pragma once

#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace crawl_sync {

class SinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Append-only destination for TSV rows.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /// Append @p row followed by '\n'.
    virtual void writeRow(const std::string& row) = 0;

    /// Push buffered rows to the destination.
    /// @throws SinkError if the destination rejected the data.
    virtual void flush() = 0;

    /// Only durable sinks can be paired with a checkpoint.
    virtual bool durable() const = 0;
};

/// Rows go to a file on disk.
class FileSink : public OutputSink {
public:
    enum class Mode { Create, Append };

    /// @throws SinkError if the file cannot be opened.
    FileSink(const std::string& path, Mode mode);

    void writeRow(const std::string& row) override;
    void flush() override;
    bool durable() const override { return true; }

    const std::string& path() const { return mPath; }

private:
    std::string   mPath;
    std::ofstream mOut;
};

/// Rows go to an already open stream (stdout).  Not resumable.
class StreamSink : public OutputSink {
public:
    explicit StreamSink(std::ostream& out) : mOut(out) {}

    void writeRow(const std::string& row) override;
    void flush() override;
    bool durable() const override { return false; }

private:
    std::ostream& mOut;
};

} // namespace crawl_sync
