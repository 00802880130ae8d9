#pragma once
#include <optional>
#include <string>

namespace tessera {

struct ArtifactPart {
    std::string filename;
    std::string media_type;
    std::string bytes;
};

// ---------------------------------------------------------------------------
// WireSubmission: the three named parts that travel as one unit.
//   payload        claim JSON (not necessarily canonical)
//   signature      128 hex chars over the canonical claim bytes
//   artifact       raw bytes + filename hint + media type
//   canon_version  optional; absent means tessera-canon/1
// A unit missing any of the first three is never partially processed.
// ---------------------------------------------------------------------------
struct WireSubmission {
    std::optional<std::string>  payload;
    std::optional<std::string>  signature;
    std::optional<ArtifactPart> artifact;
    std::optional<std::string>  canon_version;

    bool complete() const { return payload && signature && artifact; }
};

struct EncodedBody {
    std::string content_type;   // multipart/form-data; boundary=...
    std::string body;
};

// RFC 7578 multipart/form-data. Boundary is random and checked against every
// part's content.
EncodedBody encode_multipart(const WireSubmission& wire);

// Parses a multipart/form-data body. Unknown parts are skipped. Throws
// MalformedInput on a missing boundary, duplicate parts, or a truncated body
// (no closing delimiter). Missing parts are left empty for the caller to reject.
WireSubmission decode_multipart(const std::string& body, const std::string& content_type);

} // namespace tessera
