#include "id_utils.h"
#include "logger.h"

#include <sodium.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

void ensure_sodium() {
    static const bool ready = [] {
        if (sodium_init() < 0) {
            LOG_ERROR("IDS: libsodium initialization failed");
            return false;
        }
        return true;
    }();
    if (!ready) {
        throw std::runtime_error("libsodium init failed");
    }
}

std::string to_base36(uint64_t value) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

std::string random_hex(size_t chars) {
    ensure_sodium();
    std::vector<unsigned char> raw((chars + 1) / 2);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(raw.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), raw.data(), raw.size());
    hex.resize(chars);
    return hex;
}

} // namespace

std::string generate_room_id(size_t length) {
    if (length == 0) length = 8;
    return random_hex(length);
}

std::string generate_peer_id() {
    ensure_sodium();
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string id = "id_";
    for (int i = 0; i < 9; ++i) {
        id += digits[randombytes_uniform(36)];
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    id += to_base36(static_cast<uint64_t>(millis));
    return id;
}

std::string generate_file_id() {
    // RFC 4122 version 4 layout
    ensure_sodium();
    unsigned char raw[16];
    randombytes_buf(raw, sizeof(raw));
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0f) | 0x40);
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3f) | 0x80);

    char hex[33];
    sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
    const std::string h(hex, 32);
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" + h.substr(16, 4) + "-" + h.substr(20);
}

std::string generate_channel_token() {
    return random_hex(32);
}

bool tokens_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    ensure_sodium();
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}
