#include "output_sink.hpp"

namespace crawl_sync {

FileSink::FileSink(const std::string& path, Mode mode)
    : mPath(path)
{
    const auto openMode = std::ios::binary |
        (mode == Mode::Create ? std::ios::out | std::ios::trunc
                              : std::ios::out | std::ios::app);
    mOut.open(mPath, openMode);
    if (!mOut) {
        throw SinkError("Cannot open output file " + mPath);
    }
}

void FileSink::writeRow(const std::string& row) {
    mOut.write(row.data(), static_cast<std::streamsize>(row.size()));
    mOut.put('\n');
}

void FileSink::flush() {
    mOut.flush();
    if (!mOut) {
        throw SinkError("Failed writing to output file " + mPath);
    }
}

void StreamSink::writeRow(const std::string& row) {
    mOut << row << '\n';
}

void StreamSink::flush() {
    mOut.flush();
    if (!mOut) {
        throw SinkError("Failed writing to output stream");
    }
}

} // namespace crawl_sync
