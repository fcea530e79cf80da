#pragma once

#include "config.h"
#include "errors.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace voice_relay {

/// HTTP header name/value pairs, in order
using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Source of the authentication headers for the upstream handshake
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    /**
     * @brief Headers that authenticate one upstream connection
     * @return Header set, or an AuthError
     */
    virtual Result<HttpHeaders> auth_headers() = 0;

    /// Short name for log lines ("api-key", "managed-identity")
    virtual std::string kind() const = 0;
};

/**
 * @brief Static key sent as the api-key header
 */
class ApiKeyCredential : public CredentialProvider {
public:
    explicit ApiKeyCredential(std::string api_key);

    Result<HttpHeaders> auth_headers() override;
    std::string kind() const override { return "api-key"; }

private:
    std::string api_key_;
};

/**
 * @brief Bearer token from the instance metadata service (user-assigned identity)
 *
 * Tokens are cached until five minutes before they expire. Thread-safe.
 */
class ManagedIdentityCredential : public CredentialProvider {
public:
    /**
     * @param client_id Client id of the user-assigned identity
     * @param scope Token scope; a trailing "/.default" is stripped to form the resource
     * @param imds_endpoint Token endpoint of the metadata service
     */
    ManagedIdentityCredential(std::string client_id, std::string scope, std::string imds_endpoint);
    ~ManagedIdentityCredential() override;

    Result<HttpHeaders> auth_headers() override;
    std::string kind() const override { return "managed-identity"; }

    /// Resource string for a scope ("https://x/.default" -> "https://x")
    static std::string scope_to_resource(const std::string& scope);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Managed identity when a client id is configured, else the API key
 */
std::shared_ptr<CredentialProvider> make_credential_provider(const UpstreamConfig& config);

} // namespace voice_relay
