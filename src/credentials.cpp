#include "credentials.h"
#include "logger.h"
#include <curl/curl.h>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voice_relay {

ApiKeyCredential::ApiKeyCredential(std::string api_key) : api_key_(std::move(api_key)) {}

Result<HttpHeaders> ApiKeyCredential::auth_headers() {
    if (api_key_.empty()) {
        return make_auth_error("No API key configured");
    }
    return HttpHeaders{{"api-key", api_key_}};
}

class ManagedIdentityCredential::Impl {
public:
    Impl(std::string client_id, std::string scope, std::string imds_endpoint)
        : client_id_(std::move(client_id)), resource_(scope_to_resource(scope)),
          imds_endpoint_(std::move(imds_endpoint)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<HttpHeaders> auth_headers() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (token_.empty() || now >= refresh_at_) {
            auto fetched = fetch_token();
            if (!fetched) {
                return fetched.error();
            }
        }
        return HttpHeaders{{"Authorization", "Bearer " + token_}};
    }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

    std::string escape(CURL* curl, const std::string& value) {
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (!escaped) {
            return value;
        }
        std::string out(escaped);
        curl_free(escaped);
        return out;
    }

    VoidResult fetch_token() {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_auth_error("Failed to initialize CURL");
        }

        std::string url = imds_endpoint_ + "?api-version=2018-02-01&resource=" + escape(curl, resource_);
        if (!client_id_.empty()) {
            url += "&client_id=" + escape(curl, client_id_);
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Metadata: true");

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 10000L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 2000L);
        curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");

        LOG_UPSTREAM("Requesting managed identity token for " + resource_);
        CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return make_auth_error(std::string("Token request failed: ") + curl_easy_strerror(res));
        }
        if (http_code != 200) {
            return make_auth_error("Token request returned HTTP " + std::to_string(http_code) +
                                   ": " + response_buffer);
        }

        try {
            json response = json::parse(response_buffer);
            if (!response.contains("access_token") || !response["access_token"].is_string()) {
                return make_auth_error("Token response has no access_token");
            }
            token_ = response["access_token"].get<std::string>();

            long expires_in = 3600;
            if (response.contains("expires_in")) {
                const auto& value = response["expires_in"];
                if (value.is_number_integer()) {
                    expires_in = value.get<long>();
                } else if (value.is_string()) {
                    expires_in = std::stol(value.get<std::string>());
                }
            }
            // Refresh five minutes early
            long lifetime = expires_in > 600 ? expires_in - 300 : expires_in / 2;
            refresh_at_ = std::chrono::steady_clock::now() + std::chrono::seconds(lifetime);
        } catch (const json::exception& e) {
            return make_auth_error(std::string("Token response parse error: ") + e.what());
        } catch (const std::logic_error& e) {
            return make_auth_error(std::string("Token response has bad expires_in: ") + e.what());
        }

        LOG_UPSTREAM("Managed identity token acquired");
        return VoidResult();
    }

    std::string client_id_;
    std::string resource_;
    std::string imds_endpoint_;

    std::mutex mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point refresh_at_;
};

ManagedIdentityCredential::ManagedIdentityCredential(std::string client_id, std::string scope,
                                                     std::string imds_endpoint)
    : pimpl_(std::make_unique<Impl>(std::move(client_id), std::move(scope), std::move(imds_endpoint))) {}

ManagedIdentityCredential::~ManagedIdentityCredential() = default;

Result<HttpHeaders> ManagedIdentityCredential::auth_headers() {
    return pimpl_->auth_headers();
}

std::string ManagedIdentityCredential::scope_to_resource(const std::string& scope) {
    const std::string suffix = "/.default";
    if (scope.size() >= suffix.size() &&
        scope.compare(scope.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return scope.substr(0, scope.size() - suffix.size());
    }
    return scope;
}

std::shared_ptr<CredentialProvider> make_credential_provider(const UpstreamConfig& config) {
    if (!config.client_id.empty()) {
        Logger::info("Using managed identity credential");
        return std::make_shared<ManagedIdentityCredential>(config.client_id, config.token_scope,
                                                           config.imds_endpoint);
    }
    Logger::info("Using API key credential");
    return std::make_shared<ApiKeyCredential>(config.api_key);
}

} // namespace voice_relay
