#include "ClientConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const char* kVariables[] = {
    "OPAMP_SERVER_URL", "OPAMP_POLL_INTERVAL_SECONDS", "OPAMP_REQUEST_TIMEOUT_SECONDS", "OPAMP_INSTANCE_UID",
    "OPAMP_API_KEY", "OPAMP_BEARER_TOKEN", "OPAMP_CODEC", "OPAMP_MTLS_ENABLED", "OPAMP_MTLS_CERT_PATH",
    "OPAMP_MTLS_KEY_PATH", "OPAMP_MTLS_CA_PATH", "OPAMP_MTLS_VERIFY_PEER", "OPAMP_MTLS_VERIFY_HOST",
    "OPAMP_OTEL_ENABLED", "OPAMP_OTEL_ENDPOINT", "OPAMP_GZIP_ENABLED"};

void ClearEnv() {
    for (const char* name : kVariables) {
        unsetenv(name);
    }
}

bool LoadsWith(const char* name, const char* value) {
    ClearEnv();
    setenv(name, value, 1);
    ClientConfig config;
    std::string error;
    return LoadClientConfigFromEnv(config, error);
}

int TestDefaults() {
    ClearEnv();
    ClientConfig config;
    std::string error;
    if (!LoadClientConfigFromEnv(config, error)) {
        return Fail("Defaults rejected: " + error);
    }
    if (config.serverUrl != "http://localhost:4320/v1/opamp" || config.pollInterval.count() != 30
        || config.codec != "protobuf" || config.tls.enabled || config.trace.enabled || config.gzip) {
        return Fail("Unexpected default configuration.");
    }
    if (config.trace.serviceName != "opamp-agent") {
        return Fail("Trace service name should default to opamp-agent.");
    }
    return 0;
}

int TestOverrides() {
    ClearEnv();
    setenv("OPAMP_SERVER_URL", "https://opamp.example:4320/v1/opamp", 1);
    setenv("OPAMP_POLL_INTERVAL_SECONDS", "5", 1);
    setenv("OPAMP_INSTANCE_UID", "0190a3f2-0000-7000-8000-000000000001", 1);
    setenv("OPAMP_API_KEY", "key", 1);
    setenv("OPAMP_CODEC", "json", 1);
    setenv("OPAMP_OTEL_ENABLED", "yes", 1);
    setenv("OPAMP_GZIP_ENABLED", "true", 1);

    ClientConfig config;
    std::string error;
    if (!LoadClientConfigFromEnv(config, error)) {
        return Fail("Valid overrides rejected: " + error);
    }
    if (config.pollInterval.count() != 5 || config.codec != "json" || !config.trace.enabled) {
        return Fail("Overrides not applied.");
    }

    const HttpTransportSettings transport = ToTransportSettings(config);
    if (transport.endpoint != config.serverUrl || transport.apiKey != "key"
        || transport.requestTimeout != std::chrono::seconds(30) || !transport.gzip) {
        return Fail("Transport settings do not follow the configuration.");
    }
    return 0;
}

int TestRejectsMalformedValues() {
    const char* const rejected[][2] = {
        {"OPAMP_SERVER_URL", "ftp://server"},
        {"OPAMP_POLL_INTERVAL_SECONDS", "0"},
        {"OPAMP_POLL_INTERVAL_SECONDS", "86401"},
        {"OPAMP_POLL_INTERVAL_SECONDS", "10s"},
        {"OPAMP_REQUEST_TIMEOUT_SECONDS", ""},
        {"OPAMP_INSTANCE_UID", "1234"},
        {"OPAMP_CODEC", "xml"}};
    for (const auto& entry : rejected) {
        if (LoadsWith(entry[0], entry[1])) {
            return Fail(std::string("Accepted ") + entry[0] + "=" + entry[1]);
        }
    }
    if (!LoadsWith("OPAMP_POLL_INTERVAL_SECONDS", "86400")) {
        return Fail("A 24h poll interval should be accepted.");
    }
    return 0;
}

int TestMutualTls() {
    ClearEnv();
    setenv("OPAMP_MTLS_ENABLED", "true", 1);
    ClientConfig config;
    std::string error;
    if (LoadClientConfigFromEnv(config, error)) {
        return Fail("mTLS over plain http accepted.");
    }

    setenv("OPAMP_SERVER_URL", "https://opamp.example/v1/opamp", 1);
    ClientConfig missingPaths;
    if (LoadClientConfigFromEnv(missingPaths, error)) {
        return Fail("mTLS without certificate paths accepted.");
    }

    const auto dir = std::filesystem::temp_directory_path() / "opamp-client-config-test";
    std::filesystem::create_directories(dir);
    for (const char* name : {"client.crt", "client.key", "ca.crt"}) {
        std::ofstream(dir / name) << "pem";
    }
    setenv("OPAMP_MTLS_CERT_PATH", (dir / "client.crt").c_str(), 1);
    setenv("OPAMP_MTLS_KEY_PATH", (dir / "client.key").c_str(), 1);
    setenv("OPAMP_MTLS_CA_PATH", (dir / "ca.crt").c_str(), 1);
    setenv("OPAMP_MTLS_VERIFY_HOST", "1", 1);

    ClientConfig secured;
    if (!LoadClientConfigFromEnv(secured, error)) {
        return Fail("Complete mTLS configuration rejected: " + error);
    }
    if (!secured.tls.enabled || !secured.tls.verifyHost || !secured.tls.verifyPeer) {
        return Fail("mTLS flags not applied.");
    }
    if (!WaitForTlsFiles(secured.tls, 0)) {
        return Fail("Existing TLS files not found.");
    }

    std::filesystem::remove(dir / "ca.crt");
    const bool found = WaitForTlsFiles(secured.tls, 0);
    std::filesystem::remove_all(dir);
    if (found) {
        return Fail("Missing CA file not detected.");
    }
    return 0;
}

int TestEnvHelpers() {
    ClearEnv();
    setenv("OPAMP_OTEL_ENABLED", "maybe", 1);
    if (!GetEnvBool("OPAMP_OTEL_ENABLED", true) || GetEnvBool("OPAMP_OTEL_ENABLED", false)) {
        return Fail("Unrecognised booleans should fall back to the default.");
    }
    setenv("OPAMP_OTEL_ENABLED", "NO", 1);
    if (GetEnvBool("OPAMP_OTEL_ENABLED", true)) {
        return Fail("Boolean parsing should ignore case.");
    }
    if (GetEnvOrDefault("OPAMP_API_KEY", "fallback") != "fallback") {
        return Fail("Unset variables should yield the default.");
    }
    ClearEnv();
    return 0;
}
} // namespace

int main() {
    if (const int rc = TestDefaults()) {
        return rc;
    }
    if (const int rc = TestOverrides()) {
        return rc;
    }
    if (const int rc = TestRejectsMalformedValues()) {
        return rc;
    }
    if (const int rc = TestMutualTls()) {
        return rc;
    }
    return TestEnvHelpers();
}
