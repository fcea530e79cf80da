#pragma once

/**
 * @file url_utils.h
 * @brief URL building and parsing for the upstream and downstream WebSockets
 */

#include "config.h"
#include "errors.h"
#include <optional>
#include <string>

namespace voice_relay {

/**
 * Realtime endpoint for the configured service:
 * {endpoint}/voice-live/realtime?api-version={api_version}&model={model}
 * Trailing '/' on the endpoint is trimmed; https:// becomes wss://, http:// becomes ws://.
 */
std::string build_realtime_url(const UpstreamConfig& config);

struct WsUrl {
    bool secure = true;
    std::string host;
    std::string port;    ///< Defaults to 443 (wss) or 80 (ws)
    std::string target;  ///< Path plus query, at least "/"
};

/// Split a ws:// or wss:// URL; other schemes are a ParseError
Result<WsUrl> parse_ws_url(const std::string& url);

/// Path part of a request target ("/acs/ws?callerId=1" -> "/acs/ws")
std::string target_path(const std::string& target);

/**
 * Value of a query parameter in a request target, percent-decoded.
 * Returns nullopt when the parameter is absent.
 */
std::optional<std::string> query_param(const std::string& target, const std::string& name);

/// Decode %XX escapes and '+' as space; malformed escapes are kept verbatim
std::string percent_decode(const std::string& text);

} // namespace voice_relay
