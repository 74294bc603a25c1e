#include "CprHttpTransport.hpp"
#include "ContentEncoding.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>

#include <iostream>
#include <utility>

namespace {
cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    return cpr::Ssl(
        cpr::ssl::CaInfo{settings.caPath},
        cpr::ssl::CertFile{settings.certPath},
        cpr::ssl::KeyFile{settings.keyPath},
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
}

cpr::Header AddTraceParentHeader(cpr::Header headers) {
    if (headers.find("traceparent") == headers.end()) {
        headers["traceparent"] = NewTraceParent();
    }
    return headers;
}

cpr::Header AddApiKeyHeader(cpr::Header headers, const std::string& apiKey) {
    if (!apiKey.empty()) {
        headers["X-API-Key"] = apiKey;
    }
    return headers;
}

cpr::Header AddBearerHeader(cpr::Header headers, const std::string& token) {
    if (!token.empty()) {
        headers["Authorization"] = "Bearer " + token;
    }
    return headers;
}

TransportErrorCode MapError(const cpr::Error& error, bool cancelled) {
    if (error.code == cpr::ErrorCode::OK) {
        return TransportErrorCode::None;
    }
    if (cancelled) {
        return TransportErrorCode::Cancelled;
    }
    if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        return TransportErrorCode::Timeout;
    }
    if (error.code == cpr::ErrorCode::COULDNT_CONNECT || error.code == cpr::ErrorCode::COULDNT_RESOLVE_HOST) {
        return TransportErrorCode::ConnectionFailed;
    }
    return TransportErrorCode::Other;
}
} // namespace

CprHttpTransport::CprHttpTransport(HttpTransportSettings settings)
    : settings_(std::move(settings)) {}

TransportResponse CprHttpTransport::Post(const std::string& body, const HttpHeaders& headers) {
    HttpTransportSettings settings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings = settings_;
    }
    cancelled_ = false;

    std::string payload = body;
    HttpHeaders merged = settings.headers;
    for (const auto& [key, value] : headers) {
        merged[key] = value;
    }
    if (settings.gzip) {
        std::string error;
        if (!ApplyGzipRequestEncoding(payload, merged, error)) {
            TransportResponse failed;
            failed.error = TransportErrorCode::Other;
            failed.errorMessage = "gzip request body: " + error;
            return failed;
        }
    }

    cpr::Header requestHeaders;
    for (const auto& [key, value] : merged) {
        requestHeaders[key] = value;
    }
    requestHeaders = AddTraceParentHeader(std::move(requestHeaders));
    requestHeaders = AddApiKeyHeader(std::move(requestHeaders), settings.apiKey);
    requestHeaders = AddBearerHeader(std::move(requestHeaders), settings.bearerToken);

    // Returning false from the progress callback makes libcurl abort.
    cpr::ProgressCallback progress(
        [this](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) {
            return !cancelled_.load();
        });

    cpr::Response response = settings.tls.enabled
        ? cpr::Post(
            cpr::Url{settings.endpoint},
            cpr::Body{payload},
            requestHeaders,
            cpr::ConnectTimeout{settings.connectTimeout},
            cpr::Timeout{settings.requestTimeout},
            progress,
            BuildSslOptions(settings.tls))
        : cpr::Post(
            cpr::Url{settings.endpoint},
            cpr::Body{payload},
            requestHeaders,
            cpr::ConnectTimeout{settings.connectTimeout},
            cpr::Timeout{settings.requestTimeout},
            progress);

    TransportResponse result;
    result.error = MapError(response.error, cancelled_.load());
    result.errorMessage = response.error.message;
    result.statusCode = response.status_code;
    result.body = std::move(response.text);
    for (const auto& [key, value] : response.header) {
        result.headers[key] = value;
    }

    std::string error;
    if (result.RequestOk() && !DecodeResponseBody(result, error)) {
        result.error = TransportErrorCode::Other;
        result.errorMessage = "gzip reply body: " + error;
    }
    return result;
}

void CprHttpTransport::Cancel() {
    cancelled_ = true;
}

bool CprHttpTransport::Reconfigure(const OpampConnectionSettings& offer) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!offer.destinationEndpoint.empty()) {
        const bool https = offer.destinationEndpoint.rfind("https://", 0) == 0;
        if (settings_.tls.enabled && !https) {
            std::cerr << "[OpAMP] Refusing to leave mTLS for " << offer.destinationEndpoint << std::endl;
            return false;
        }
        settings_.endpoint = offer.destinationEndpoint;
    }

    // Offered headers replace the ones from the previous offer.
    if (!offer.headers.empty()) {
        settings_.headers.clear();
        for (const auto& header : offer.headers) {
            settings_.headers[header.key] = header.value;
        }
    }

    if (offer.certificate) {
        std::cerr << "[OpAMP] Offered client certificate ignored; certificates are read from disk" << std::endl;
    }

    std::cout << "[OpAMP] Transport now targets " << settings_.endpoint << std::endl;
    return true;
}

std::string CprHttpTransport::Endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.endpoint;
}
