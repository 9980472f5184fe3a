#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/compress.h — gzip encoding for static responses (zlib)
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>
#include <zlib.h>

namespace shorturl::compress {

struct Options {
    int level = Z_DEFAULT_COMPRESSION;
    std::size_t threshold = 1024; // Bodies below this are sent as-is
};

// windowBits 15 + 16 selects the gzip wrapper instead of raw zlib
inline std::string gzipCompress(const std::string& input, int level = Z_DEFAULT_COMPRESSION) {
    z_stream zs{};
    if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.resize(deflateBound(&zs, static_cast<uLong>(input.size())));

    zs.next_out = reinterpret_cast<Bytef*>(output.data());
    zs.avail_out = static_cast<uInt>(output.size());

    int rc = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("gzip deflate did not finish");
    }

    output.resize(zs.total_out);
    return output;
}

inline std::string gzipDecompress(const std::string& input) {
    z_stream zs{};
    if (inflateInit2(&zs, 15 + 16) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    char buf[16384];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        output.append(buf, sizeof(buf) - zs.avail_out);
    } while (ret == Z_OK);

    inflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("gzip stream is corrupt or truncated");
    }
    return output;
}

inline bool acceptsGzip(const std::string& acceptEncoding) {
    return acceptEncoding.find("gzip") != std::string::npos;
}

} // namespace shorturl::compress
