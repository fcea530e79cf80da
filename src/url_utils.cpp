#include "url_utils.h"
#include "utils.h"
#include <cctype>

namespace voice_relay {

std::string build_realtime_url(const UpstreamConfig& config) {
    std::string base = config.endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (utils::starts_with(base, "https://")) {
        base = "wss://" + base.substr(8);
    } else if (utils::starts_with(base, "http://")) {
        base = "ws://" + base.substr(7);
    }
    return base + "/voice-live/realtime?api-version=" + config.api_version + "&model=" + config.model;
}

Result<WsUrl> parse_ws_url(const std::string& url) {
    WsUrl out;
    std::string rest;
    if (utils::starts_with(url, "wss://")) {
        out.secure = true;
        rest = url.substr(6);
    } else if (utils::starts_with(url, "ws://")) {
        out.secure = false;
        rest = url.substr(5);
    } else {
        return make_parse_error("Unsupported URL scheme: " + url);
    }

    size_t slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (out.target[0] == '?') {
        out.target = "/" + out.target;
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = out.secure ? "443" : "80";
    }

    if (out.host.empty()) {
        return make_parse_error("URL has no host: " + url);
    }
    if (out.port.empty()) {
        return make_parse_error("URL has an empty port: " + url);
    }
    return out;
}

std::string target_path(const std::string& target) {
    return target.substr(0, target.find('?'));
}

std::optional<std::string> query_param(const std::string& target, const std::string& name) {
    size_t q = target.find('?');
    if (q == std::string::npos) {
        return std::nullopt;
    }
    std::string query = target.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        size_t eq = pair.find('=');
        std::string key = percent_decode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string::npos ? std::string() : percent_decode(pair.substr(eq + 1));
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace voice_relay
