#include "ContentEncoding.hpp"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace {
constexpr int kGzipWindowBits = 15 + 16;
constexpr size_t kChunkSize = 16 * 1024;
// Replies inflating past this are treated as corrupt.
constexpr size_t kMaxInflatedSize = 64 * 1024 * 1024;

bool HasGzipMagic(const std::string& body) {
    return body.size() >= 2 && static_cast<unsigned char>(body[0]) == 0x1f
        && static_cast<unsigned char>(body[1]) == 0x8b;
}

std::string Lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

std::string ZlibError(const char* operation, int code, const z_stream& stream) {
    return std::string(operation) + " failed (" + std::to_string(code) + ")"
        + (stream.msg != nullptr ? std::string(": ") + stream.msg : std::string());
}
} // namespace

bool GzipCompress(const std::string& input, std::string& out, std::string& error) {
    z_stream stream{};
    int rc = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        error = ZlibError("deflateInit2", rc, stream);
        return false;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    std::string compressed;
    char chunk[kChunkSize];
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = sizeof(chunk);
        rc = deflate(&stream, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            error = ZlibError("deflate", rc, stream);
            deflateEnd(&stream);
            return false;
        }
        compressed.append(chunk, sizeof(chunk) - stream.avail_out);
    } while (rc != Z_STREAM_END);

    deflateEnd(&stream);
    out = std::move(compressed);
    return true;
}

bool GzipDecompress(const std::string& input, std::string& out, std::string& error) {
    z_stream stream{};
    int rc = inflateInit2(&stream, kGzipWindowBits);
    if (rc != Z_OK) {
        error = ZlibError("inflateInit2", rc, stream);
        return false;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    std::string inflated;
    char chunk[kChunkSize];
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            error = ZlibError("inflate", rc, stream);
            inflateEnd(&stream);
            return false;
        }
        inflated.append(chunk, sizeof(chunk) - stream.avail_out);
        if (inflated.size() > kMaxInflatedSize) {
            error = "inflated reply exceeds " + std::to_string(kMaxInflatedSize) + " bytes";
            inflateEnd(&stream);
            return false;
        }
        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            error = "truncated gzip body";
            inflateEnd(&stream);
            return false;
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    out = std::move(inflated);
    return true;
}

bool ApplyGzipRequestEncoding(std::string& body, HttpHeaders& headers, std::string& error) {
    std::string compressed;
    if (!GzipCompress(body, compressed, error)) {
        return false;
    }
    body = std::move(compressed);
    headers["Content-Encoding"] = "gzip";
    headers["Accept-Encoding"] = "gzip";
    return true;
}

bool DecodeResponseBody(TransportResponse& response, std::string& error) {
    bool gzip = false;
    for (const auto& [key, value] : response.headers) {
        if (Lowered(key) == "content-encoding") {
            gzip = Lowered(value).find("gzip") != std::string::npos;
        }
    }
    if (!gzip || !HasGzipMagic(response.body)) {
        return true;
    }

    std::string inflated;
    if (!GzipDecompress(response.body, inflated, error)) {
        return false;
    }
    response.body = std::move(inflated);
    return true;
}
