#include "submission/Multipart.hpp"
#include "crypto/Hex.hpp"
#include "core/Errors.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace tessera;

static const std::string CRLF = "\r\n";

static std::string random_boundary() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) throw std::runtime_error("[WIRE] RAND_bytes failed");
    return "----tessera-" + hex_encode(b, sizeof(b));
}

static bool boundary_collides(const WireSubmission& w, const std::string& boundary) {
    auto hit = [&](const std::string& s) { return s.find(boundary) != std::string::npos; };
    if (w.payload && hit(*w.payload)) return true;
    if (w.signature && hit(*w.signature)) return true;
    if (w.canon_version && hit(*w.canon_version)) return true;
    if (w.artifact && (hit(w.artifact->bytes) || hit(w.artifact->filename))) return true;
    return false;
}

static std::string quote_param(const std::string& v) {
    std::string out;
    for (char c : v) {
        if (c == '"' || c == '\\' || c == '\r' || c == '\n') out += '_';
        else out += c;
    }
    return out;
}

static void append_part(std::string& out, const std::string& boundary,
                        const std::string& name, const std::string& content,
                        const char* content_type = nullptr,
                        const std::string* filename = nullptr) {
    out += "--" + boundary + CRLF;
    out += "Content-Disposition: form-data; name=\"" + name + "\"";
    if (filename) out += "; filename=\"" + quote_param(*filename) + "\"";
    out += CRLF;
    if (content_type) out += std::string("Content-Type: ") + content_type + CRLF;
    out += CRLF;
    out += content;
    out += CRLF;
}

EncodedBody tessera::encode_multipart(const WireSubmission& wire) {
    if (!wire.complete())
        throw MalformedInput("[WIRE] refusing to encode an incomplete submission");

    std::string boundary = random_boundary();
    while (boundary_collides(wire, boundary)) boundary = random_boundary();

    EncodedBody enc;
    enc.content_type = "multipart/form-data; boundary=" + boundary;

    std::string& out = enc.body;
    out.reserve(wire.artifact->bytes.size() + wire.payload->size() + 1024);
    append_part(out, boundary, "payload", *wire.payload, "application/json");
    append_part(out, boundary, "signature", *wire.signature);
    if (wire.canon_version) append_part(out, boundary, "canon_version", *wire.canon_version);
    append_part(out, boundary, "artifact", wire.artifact->bytes,
                wire.artifact->media_type.c_str(), &wire.artifact->filename);
    out += "--" + boundary + "--" + CRLF;
    return enc;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Value of `key` in a header like: form-data; name="payload"; filename="x"
static std::optional<std::string> header_param(const std::string& header, const std::string& key) {
    size_t pos = 0;
    while ((pos = header.find(';', pos)) != std::string::npos) {
        ++pos;
        size_t eq = header.find('=', pos);
        if (eq == std::string::npos) break;
        std::string k = lower(trim(header.substr(pos, eq - pos)));
        size_t vstart = eq + 1;
        std::string v;
        size_t next;
        if (vstart < header.size() && header[vstart] == '"') {
            size_t close = header.find('"', vstart + 1);
            if (close == std::string::npos) throw MalformedInput("[WIRE] unterminated quoted parameter");
            v = header.substr(vstart + 1, close - vstart - 1);
            next = close + 1;
        } else {
            next = header.find(';', vstart);
            v = trim(header.substr(vstart, next == std::string::npos ? std::string::npos : next - vstart));
        }
        if (k == key) return v;
        if (next == std::string::npos) break;
        pos = next;
    }
    return std::nullopt;
}

WireSubmission tessera::decode_multipart(const std::string& body, const std::string& content_type) {
    if (lower(content_type).rfind("multipart/form-data", 0) != 0)
        throw MalformedInput("[WIRE] content type is not multipart/form-data");
    auto boundary = header_param(content_type, "boundary");
    if (!boundary || boundary->empty()) throw MalformedInput("[WIRE] missing multipart boundary");

    const std::string delim = "--" + *boundary;
    size_t pos = body.find(delim);
    if (pos == std::string::npos) throw MalformedInput("[WIRE] no multipart delimiter in body");

    WireSubmission wire;
    bool closed = false;

    while (true) {
        pos += delim.size();
        if (body.compare(pos, 2, "--") == 0) { closed = true; break; }
        if (body.compare(pos, 2, CRLF) != 0) break;
        pos += 2;

        size_t hdr_end = body.find("\r\n\r\n", pos);
        if (hdr_end == std::string::npos) break;

        std::string name, filename, part_type;
        bool has_filename = false;
        size_t line = pos;
        while (line < hdr_end) {
            size_t eol = body.find(CRLF, line);
            if (eol == std::string::npos || eol > hdr_end) eol = hdr_end;
            std::string h = body.substr(line, eol - line);
            size_t colon = h.find(':');
            if (colon != std::string::npos) {
                std::string hname  = lower(trim(h.substr(0, colon)));
                std::string hvalue = trim(h.substr(colon + 1));
                if (hname == "content-disposition") {
                    if (auto n = header_param(hvalue, "name")) name = *n;
                    if (auto f = header_param(hvalue, "filename")) { filename = *f; has_filename = true; }
                } else if (hname == "content-type") {
                    part_type = hvalue;
                }
            }
            line = eol + 2;
        }

        size_t content_start = hdr_end + 4;
        size_t next = body.find(CRLF + delim, content_start);
        if (next == std::string::npos) break;
        std::string content = body.substr(content_start, next - content_start);

        auto once = [&](bool already) {
            if (already) throw MalformedInput("[WIRE] duplicate part: " + name);
        };
        if (name == "payload") {
            once(wire.payload.has_value());
            wire.payload = std::move(content);
        } else if (name == "signature") {
            once(wire.signature.has_value());
            wire.signature = std::move(content);
        } else if (name == "canon_version") {
            once(wire.canon_version.has_value());
            wire.canon_version = std::move(content);
        } else if (name == "artifact") {
            once(wire.artifact.has_value());
            ArtifactPart part;
            part.filename   = has_filename ? filename : "artifact";
            part.media_type = part_type.empty() ? "application/octet-stream" : part_type;
            part.bytes      = std::move(content);
            wire.artifact   = std::move(part);
        }

        pos = next + 2;   // now at the delimiter
    }

    if (!closed) throw MalformedInput("[WIRE] truncated multipart body");
    return wire;
}
