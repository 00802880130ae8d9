#include "claim/CanonicalJson.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

using namespace tessera;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Strict UTF-8 decode of one code point starting at s[i]. Advances i.
// Rejects overlong forms, encoded surrogates and anything above U+10FFFF.
// ---------------------------------------------------------------------------
static uint32_t next_code_point(const std::string& s, size_t& i) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const size_t n = s.size();
    unsigned char c = p[i];

    if (c < 0x80) { ++i; return c; }

    int      extra;
    uint32_t cp;
    uint32_t min;
    if      ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; min = 0x10000; }
    else throw MalformedInput("[CANON] invalid UTF-8 lead byte");

    if (i + static_cast<size_t>(extra) >= n)
        throw MalformedInput("[CANON] truncated UTF-8 sequence");
    for (int k = 1; k <= extra; ++k) {
        unsigned char cc = p[i + k];
        if ((cc & 0xC0) != 0x80) throw MalformedInput("[CANON] invalid UTF-8 continuation");
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        throw MalformedInput("[CANON] invalid UTF-8 code point");

    i += static_cast<size_t>(extra) + 1;
    return cp;
}

static void append_u_escape(std::string& out, uint32_t unit) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(unit));
    out += buf;
}

void tessera::canonical_string(const std::string& s, std::string& out) {
    out += '"';
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = next_code_point(s, i);
        switch (cp) {
            case '"':  out += "\\\""; continue;
            case '\\': out += "\\\\"; continue;
            case '\b': out += "\\b";  continue;
            case '\f': out += "\\f";  continue;
            case '\n': out += "\\n";  continue;
            case '\r': out += "\\r";  continue;
            case '\t': out += "\\t";  continue;
            default: break;
        }
        if (cp >= 0x20 && cp <= 0x7E) {
            out += static_cast<char>(cp);
        } else if (cp <= 0xFFFF) {
            append_u_escape(out, cp);
        } else {
            uint32_t v = cp - 0x10000;
            append_u_escape(out, 0xD800 + (v >> 10));
            append_u_escape(out, 0xDC00 + (v & 0x3FF));
        }
    }
    out += '"';
}

std::string tessera::canonical_double(double v) {
    if (!std::isfinite(v)) throw MalformedInput("[CANON] non-finite number");
    if (v == 0.0) return std::signbit(v) ? "-0.0" : "0.0";

    // Shortest round-trip digits, always in d.ddde[+-]X form.
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    if (res.ec != std::errc()) throw MalformedInput("[CANON] number formatting failed");
    std::string sci(buf, res.ptr);

    std::string out;
    size_t pos = 0;
    if (sci[0] == '-') { out += '-'; pos = 1; }

    size_t      epos = sci.find('e');
    std::string digits;
    for (size_t k = pos; k < epos; ++k) {
        if (sci[k] != '.') digits += sci[k];
    }
    int exp10 = std::atoi(sci.c_str() + epos + 1);

    // value = 0.DIGITS * 10^decpt
    const int decpt = exp10 + 1;
    const int nd    = static_cast<int>(digits.size());

    if (decpt > -4 && decpt <= 16) {
        if (decpt <= 0) {
            out += "0.";
            out.append(static_cast<size_t>(-decpt), '0');
            out += digits;
        } else if (decpt >= nd) {
            out += digits;
            out.append(static_cast<size_t>(decpt - nd), '0');
            out += ".0";
        } else {
            out += digits.substr(0, static_cast<size_t>(decpt));
            out += '.';
            out += digits.substr(static_cast<size_t>(decpt));
        }
        return out;
    }

    out += digits[0];
    if (nd > 1) {
        out += '.';
        out += digits.substr(1);
    }
    int e = decpt - 1;
    out += 'e';
    out += (e < 0) ? '-' : '+';
    if (e < 0) e = -e;
    if (e < 10) out += '0';
    out += std::to_string(e);
    return out;
}

void tessera::canonical_json(const json& value, std::string& out) {
    switch (value.type()) {
        case json::value_t::null:
            out += "null";
            return;
        case json::value_t::boolean:
            out += value.get<bool>() ? "true" : "false";
            return;
        case json::value_t::number_integer:
            out += std::to_string(value.get<int64_t>());
            return;
        case json::value_t::number_unsigned:
            out += std::to_string(value.get<uint64_t>());
            return;
        case json::value_t::number_float:
            out += canonical_double(value.get<double>());
            return;
        case json::value_t::string:
            canonical_string(value.get_ref<const std::string&>(), out);
            return;
        case json::value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& el : value) {
                if (!first) out += ',';
                canonical_json(el, out);
                first = false;
            }
            out += ']';
            return;
        }
        case json::value_t::object: {
            // Sort explicitly; do not rely on the container's ordering.
            std::vector<json::const_iterator> items;
            items.reserve(value.size());
            for (auto it = value.cbegin(); it != value.cend(); ++it) items.push_back(it);
            std::sort(items.begin(), items.end(),
                      [](const json::const_iterator& a, const json::const_iterator& b) {
                          const std::string& ka = a.key();
                          const std::string& kb = b.key();
                          int c = std::memcmp(ka.data(), kb.data(), std::min(ka.size(), kb.size()));
                          return c != 0 ? c < 0 : ka.size() < kb.size();
                      });

            out += '{';
            bool first = true;
            for (const auto& it : items) {
                if (!first) out += ',';
                canonical_string(it.key(), out);
                out += ':';
                canonical_json(it.value(), out);
                first = false;
            }
            out += '}';
            return;
        }
        case json::value_t::binary:
            throw MalformedInput("[CANON] binary values are not JSON-representable");
        case json::value_t::discarded:
        default:
            throw MalformedInput("[CANON] discarded/unknown JSON value");
    }
}

std::string tessera::canonical_json(const json& value) {
    std::string out;
    canonical_json(value, out);
    return out;
}
