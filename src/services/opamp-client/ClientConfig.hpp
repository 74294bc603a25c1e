#pragma once

#include "CprHttpTransport.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <string>

struct ClientConfig {
    std::string serverUrl = "http://localhost:4320/v1/opamp";
    std::chrono::seconds pollInterval{30};
    std::string instanceUid;
    std::string apiKey;
    std::string bearerToken;
    std::string codec = "protobuf";
    std::chrono::seconds requestTimeout{30};
    bool gzip = false;
    TlsSettings tls;
    TraceConfig trace;
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);

// Reads the OPAMP_* variables over the defaults in `config`. Returns false
// with `error` set when a value is malformed or the combination is invalid.
bool LoadClientConfigFromEnv(ClientConfig& config, std::string& error);

// Polls once per second until the mTLS files exist or the timeout runs out.
bool WaitForTlsFiles(const TlsSettings& settings, int timeoutSeconds);

HttpTransportSettings ToTransportSettings(const ClientConfig& config);
