#pragma once

#include "HttpTransport.hpp"

#include <string>

// gzip member format (RFC 1952), what OpAMP servers expect under
// Content-Encoding: gzip.
bool GzipCompress(const std::string& input, std::string& out, std::string& error);
bool GzipDecompress(const std::string& input, std::string& out, std::string& error);

// Compresses `body` in place and announces it, asking for gzip replies too.
bool ApplyGzipRequestEncoding(std::string& body, HttpHeaders& headers, std::string& error);

// Inflates a reply sent with Content-Encoding: gzip. A body the HTTP stack
// already inflated is left as it is.
bool DecodeResponseBody(TransportResponse& response, std::string& error);
