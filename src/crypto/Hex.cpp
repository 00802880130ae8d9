#include "crypto/Hex.hpp"
#include "core/Errors.hpp"

using namespace tessera;

static int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string tessera::hex_encode(const uint8_t* data, size_t len) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2 * i]     = kHex[data[i] >> 4];
        out[2 * i + 1] = kHex[data[i] & 0x0F];
    }
    return out;
}

std::string tessera::hex_encode(const std::vector<uint8_t>& bytes) {
    return hex_encode(bytes.data(), bytes.size());
}

std::vector<uint8_t> tessera::hex_decode(const std::string& hex, const char* what) {
    if (hex.size() % 2 != 0)
        throw MalformedInput(std::string("[HEX] odd-length hex in ") + what);

    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
            throw MalformedInput(std::string("[HEX] non-hex character in ") + what);
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

bool tessera::is_lower_hex(const std::string& s, size_t expected_len) {
    if (s.size() != expected_len) return false;
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}
