#include "utils.h"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <array>
#include <chrono>
#include <ctime>

namespace voice_relay {
namespace utils {

namespace {

const char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_decode_table() {
    std::array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
    }
    return table;
}

} // namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= len) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[triple & 0x3F]);
        i += 3;
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

bool base64_decode(const std::string& in, std::vector<uint8_t>& out) {
    static const std::array<int, 256> table = make_decode_table();

    out.clear();
    out.reserve((in.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (unsigned char c : in) {
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            ++symbols;
            continue;
        }
        // Data after padding is malformed
        if (padding > 0) return false;
        int value = table[c];
        if (value < 0) return false;

        accum = (accum << 6) | static_cast<uint32_t>(value);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }

    if (padding > 2) return false;
    if (padding > 0 && symbols % 4 != 0) return false;
    // Unpadded input: a single leftover symbol cannot encode a byte
    if (padding == 0 && symbols % 4 == 1) return false;
    return true;
}

std::string generate_uuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string format_local_time(const char* pattern, int days_offset) {
    auto when = std::chrono::system_clock::now() + std::chrono::hours(24 * days_offset);
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), pattern, &local_tm);
    return std::string(buf, n);
}

} // namespace utils
} // namespace voice_relay
