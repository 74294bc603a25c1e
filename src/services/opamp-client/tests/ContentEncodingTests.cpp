#include "ContentEncoding.hpp"
#include "ProtobufCodec.hpp"

#include "opamp.pb.h"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

int TestRequestEncoding() {
    std::string body(4096, 'a');
    HttpHeaders headers{{"Content-Type", "application/x-protobuf"}};
    std::string error;
    if (!ApplyGzipRequestEncoding(body, headers, error)) {
        return Fail("Request compression failed: " + error);
    }
    if (body.size() < 2 || static_cast<unsigned char>(body[0]) != 0x1f || static_cast<unsigned char>(body[1]) != 0x8b) {
        return Fail("Compressed body should start with the gzip magic.");
    }
    if (body.size() >= 4096) {
        return Fail("A repetitive body should shrink.");
    }
    if (headers["Content-Encoding"] != "gzip" || headers["Accept-Encoding"] != "gzip"
        || headers["Content-Type"] != "application/x-protobuf") {
        return Fail("gzip headers missing or content type lost.");
    }

    std::string inflated;
    if (!GzipDecompress(body, inflated, error) || inflated != std::string(4096, 'a')) {
        return Fail("Compressed request does not inflate back.");
    }
    return 0;
}

int TestGzipReplyDecodes() {
    opamp::proto::ServerToAgent proto;
    proto.set_flags(1);
    proto.mutable_remote_config()->set_config_hash("h1");

    TransportResponse response;
    response.statusCode = 200;
    response.headers["content-encoding"] = "gzip";
    std::string error;
    if (!GzipCompress(proto.SerializeAsString(), response.body, error)) {
        return Fail("Reply compression failed: " + error);
    }
    if (!DecodeResponseBody(response, error)) {
        return Fail("gzip reply not inflated: " + error);
    }

    ProtobufCodec codec;
    ServerToAgent decoded;
    if (!codec.Decode(response.body, decoded, error)) {
        return Fail("Inflated reply does not decode: " + error);
    }
    if (decoded.flags != 1 || !decoded.remoteConfig || decoded.remoteConfig->configHash != "h1") {
        return Fail("Inflated reply lost its content.");
    }
    return 0;
}

int TestPlainAndBrokenReplies() {
    std::string error;

    // libcurl may already have inflated the body while the header remains.
    TransportResponse inflated;
    inflated.headers["Content-Encoding"] = "gzip";
    inflated.body = "{}";
    if (!DecodeResponseBody(inflated, error) || inflated.body != "{}") {
        return Fail("An already inflated body should pass through.");
    }

    TransportResponse plain;
    plain.body = std::string("\x1f\x8b", 2);
    if (!DecodeResponseBody(plain, error) || plain.body.size() != 2) {
        return Fail("Bodies without Content-Encoding must not be touched.");
    }

    std::string compressed;
    if (!GzipCompress(std::string(1000, 'x'), compressed, error)) {
        return Fail("Compression failed: " + error);
    }
    TransportResponse truncated;
    truncated.headers["Content-Encoding"] = "gzip";
    truncated.body = compressed.substr(0, compressed.size() / 2);
    if (DecodeResponseBody(truncated, error)) {
        return Fail("A truncated gzip reply was accepted.");
    }

    TransportResponse corrupt;
    corrupt.headers["Content-Encoding"] = "gzip";
    corrupt.body = std::string("\x1f\x8b\x08\x00garbage", 11);
    if (DecodeResponseBody(corrupt, error) || error.empty()) {
        return Fail("A corrupt gzip reply was accepted.");
    }
    return 0;
}
} // namespace

int main() {
    if (const int rc = TestRequestEncoding()) {
        return rc;
    }
    if (const int rc = TestGzipReplyDecodes()) {
        return rc;
    }
    if (const int rc = TestPlainAndBrokenReplies()) {
        return rc;
    }
    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
