#include "compression.hpp"
#include "util.hpp"

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace io = boost::iostreams;

namespace crawl_sync {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename Decompressor>
std::string inflateWith(const std::string& body, Decompressor decompressor) {
    std::string out;
    io::filtering_istream in;
    in.push(decompressor);
    in.push(io::array_source(body.data(), body.size()));
    io::copy(in, io::back_inserter(out));
    return out;
}

} // namespace

std::string decodeContent(const std::string& body,
                          const std::string& contentEncoding) {
    const std::string encoding = lowercase(trim(contentEncoding));

    if (encoding.empty() || encoding == "identity") {
        return body;
    }

    try {
        if (encoding == "gzip" || encoding == "x-gzip") {
            return inflateWith(body, io::gzip_decompressor());
        }
        if (encoding == "deflate") {
            // RFC 9110 "deflate" is the zlib container.
            io::zlib_params params;
            params.noheader = false;
            return inflateWith(body, io::zlib_decompressor(params));
        }
    } catch (const io::gzip_error& e) {
        throw std::runtime_error(std::string("Failed to decode gzip body: ") + e.what());
    } catch (const io::zlib_error& e) {
        throw std::runtime_error(std::string("Failed to decode deflate body: ") + e.what());
    } catch (const std::ios_base::failure& e) {
        throw std::runtime_error(std::string("Failed to decode body: ") + e.what());
    }

    throw std::runtime_error("Unsupported Content-Encoding: " + contentEncoding);
}

std::string gzipCompress(const std::string& data) {
    std::string out;
    {
        io::filtering_ostream os;
        os.push(io::gzip_compressor());
        os.push(io::back_inserter(out));
        os.write(data.data(), static_cast<std::streamsize>(data.size()));
    } // chain flushes the gzip trailer on destruction
    return out;
}

} // namespace crawl_sync
