#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace tessera {

// ---------------------------------------------------------------------------
// Canonical JSON, rule set "tessera-canon/1".
//
// This is the exact input to signing and to verification. Both sides MUST run
// this encoder; nlohmann::json::dump() is never used for signed bytes.
//
//   objects   keys sorted by UTF-8 byte order, {"k":v,...}
//   arrays    original order, [v,...]
//   spacing   none, separators are ',' and ':' only
//   strings   \" \\ \b \f \n \r \t; every other byte outside 0x20..0x7e as
//             \uXXXX (lowercase, surrogate pairs above U+FFFF)
//   integers  plain decimal
//   floats    shortest round-trip digits; positional when -4 < decpt <= 16
//             (".0" added to integral values), else d.ddde[+-]XX
//   literals  true false null
//
// Output is byte-identical to Python's
//   json.dumps(v, sort_keys=True, separators=(',', ':'))
// for any value Python can represent. Any change here is a new version.
// ---------------------------------------------------------------------------
constexpr const char* CANON_VERSION = "tessera-canon/1";

// Throws MalformedInput on NaN/Inf, invalid UTF-8, binary or discarded values.
std::string canonical_json(const nlohmann::json& value);
void        canonical_json(const nlohmann::json& value, std::string& out);

std::string canonical_double(double v);
void        canonical_string(const std::string& s, std::string& out);

} // namespace tessera
