#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tessera {

// Lowercase hex, two chars per byte.
std::string hex_encode(const uint8_t* data, size_t len);
std::string hex_encode(const std::vector<uint8_t>& bytes);

// Strict decode: even length, [0-9a-fA-F] only. Throws MalformedInput.
// `what` names the field in the error message; the input itself is never
// echoed back because it may be key material.
std::vector<uint8_t> hex_decode(const std::string& hex, const char* what);

bool is_lower_hex(const std::string& s, size_t expected_len);

} // namespace tessera
