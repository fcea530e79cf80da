#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace voice_relay {

/**
 * @brief String, encoding and identifier helpers
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    result.erase(0, result.find_first_not_of(" \t\n\r"));
    result.erase(result.find_last_not_of(" \t\n\r") + 1);
    return result;
}

inline std::string to_lower_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline std::string to_upper_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::toupper(c); });
    return result;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Join strings with a separator ("a, b, c")
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Encode bytes as standard base64 (RFC 4648, with '=' padding)
 */
std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

inline std::string base64_encode(const std::string& data) {
    return base64_encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

/**
 * @brief Decode standard base64
 * @param in Encoded text; whitespace is skipped
 * @param out Decoded bytes (cleared first)
 * @return false if the input contains characters outside the alphabet or has a bad length
 */
bool base64_decode(const std::string& in, std::vector<uint8_t>& out);

/**
 * @brief Random RFC 4122 version 4 UUID in canonical text form
 *
 * Safe to call from any thread.
 */
std::string generate_uuid();

/**
 * @brief Format local time with a strftime pattern
 * @param days_offset Days to add to the current date
 */
std::string format_local_time(const char* pattern, int days_offset = 0);

} // namespace utils
} // namespace voice_relay
