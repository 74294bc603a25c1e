#include "ClientConfig.hpp"
#include "InstanceUid.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace {
constexpr long long kMaxSeconds = 24LL * 60 * 60;

bool GetEnvSeconds(const char* name, std::chrono::seconds& out, std::string& error) {
    const char* value = std::getenv(name);
    if (!value) {
        return true;
    }

    char* end = nullptr;
    const long long seconds = std::strtoll(value, &end, 10);
    if (*value == '\0' || end == nullptr || *end != '\0' || seconds <= 0 || seconds > kMaxSeconds) {
        error = std::string(name) + " must be a whole number of seconds in [1, 86400], got '" + value + "'";
        return false;
    }
    out = std::chrono::seconds(seconds);
    return true;
}
} // namespace

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

bool LoadClientConfigFromEnv(ClientConfig& config, std::string& error) {
    config.serverUrl = GetEnvOrDefault("OPAMP_SERVER_URL", config.serverUrl);
    if (config.serverUrl.rfind("http://", 0) != 0 && config.serverUrl.rfind("https://", 0) != 0) {
        error = "OPAMP_SERVER_URL must be an http or https URL";
        return false;
    }

    if (!GetEnvSeconds("OPAMP_POLL_INTERVAL_SECONDS", config.pollInterval, error)
        || !GetEnvSeconds("OPAMP_REQUEST_TIMEOUT_SECONDS", config.requestTimeout, error)) {
        return false;
    }

    config.instanceUid = GetEnvOrDefault("OPAMP_INSTANCE_UID", config.instanceUid);
    InstanceUid parsed;
    if (!config.instanceUid.empty() && !InstanceUid::Parse(config.instanceUid, parsed)) {
        error = "OPAMP_INSTANCE_UID must be 32 hex digits (hyphens allowed)";
        return false;
    }

    config.apiKey = GetEnvOrDefault("OPAMP_API_KEY", config.apiKey);
    config.bearerToken = GetEnvOrDefault("OPAMP_BEARER_TOKEN", config.bearerToken);

    config.codec = GetEnvOrDefault("OPAMP_CODEC", config.codec);
    if (config.codec != "protobuf" && config.codec != "json") {
        error = "OPAMP_CODEC must be 'protobuf' or 'json'";
        return false;
    }

    config.gzip = GetEnvBool("OPAMP_GZIP_ENABLED", config.gzip);

    config.tls.enabled = GetEnvBool("OPAMP_MTLS_ENABLED", config.tls.enabled);
    if (config.tls.enabled) {
        config.tls.certPath = GetEnvOrDefault("OPAMP_MTLS_CERT_PATH", config.tls.certPath);
        config.tls.keyPath = GetEnvOrDefault("OPAMP_MTLS_KEY_PATH", config.tls.keyPath);
        config.tls.caPath = GetEnvOrDefault("OPAMP_MTLS_CA_PATH", config.tls.caPath);
        config.tls.verifyPeer = GetEnvBool("OPAMP_MTLS_VERIFY_PEER", config.tls.verifyPeer);
        config.tls.verifyHost = GetEnvBool("OPAMP_MTLS_VERIFY_HOST", config.tls.verifyHost);

        if (config.serverUrl.rfind("https://", 0) != 0) {
            error = "OPAMP_MTLS_ENABLED requires an https server URL";
            return false;
        }
        if (config.tls.certPath.empty() || config.tls.keyPath.empty() || config.tls.caPath.empty()) {
            error = "OPAMP_MTLS_ENABLED requires cert, key and CA paths";
            return false;
        }
    }

    config.trace.enabled = GetEnvBool("OPAMP_OTEL_ENABLED", config.trace.enabled);
    config.trace.endpoint = GetEnvOrDefault("OPAMP_OTEL_ENDPOINT", config.trace.endpoint);
    if (config.trace.serviceName.empty()) {
        config.trace.serviceName = "opamp-agent";
    }
    return true;
}

bool WaitForTlsFiles(const TlsSettings& settings, int timeoutSeconds) {
    if (settings.certPath.empty() || settings.keyPath.empty() || settings.caPath.empty()) {
        return false;
    }

    for (int attempt = 0; attempt <= timeoutSeconds; ++attempt) {
        if (std::filesystem::exists(settings.certPath)
            && std::filesystem::exists(settings.keyPath)
            && std::filesystem::exists(settings.caPath)) {
            return true;
        }

        if (attempt < timeoutSeconds) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    return false;
}

HttpTransportSettings ToTransportSettings(const ClientConfig& config) {
    HttpTransportSettings settings;
    settings.endpoint = config.serverUrl;
    settings.tls = config.tls;
    settings.apiKey = config.apiKey;
    settings.bearerToken = config.bearerToken;
    settings.requestTimeout = config.requestTimeout;
    settings.gzip = config.gzip;
    return settings;
}
