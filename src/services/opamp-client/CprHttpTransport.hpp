#pragma once

#include "HttpTransport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

struct TlsSettings {
    bool enabled = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = false;
};

struct HttpTransportSettings {
    std::string endpoint;
    TlsSettings tls;
    std::string apiKey;
    std::string bearerToken;
    HttpHeaders headers;
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(3)};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
    // gzip request bodies. gzip replies are inflated either way.
    bool gzip = false;
};

// Plain-HTTP OpAMP transport on cpr. Cancel aborts the running request
// through the cpr progress callback.
class CprHttpTransport : public HttpTransport {
public:
    explicit CprHttpTransport(HttpTransportSettings settings);

    TransportResponse Post(const std::string& body, const HttpHeaders& headers) override;
    void Cancel() override;
    bool Reconfigure(const OpampConnectionSettings& settings) override;

    std::string Endpoint() const;

private:
    mutable std::mutex mutex_;
    HttpTransportSettings settings_;
    std::atomic<bool> cancelled_{false};
};
