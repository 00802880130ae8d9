#pragma once
#include <stdexcept>
#include <string>

namespace tessera {

// ---------------------------------------------------------------------------
// IoError: artifact unreadable, key file missing, archive write failed.
// Always carries the path that failed so the caller can report it.
// ---------------------------------------------------------------------------
class IoError : public std::runtime_error {
public:
    IoError(const std::string& what, const std::string& path)
        : std::runtime_error(what + " (path=" + path + ")"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Input that can never produce a valid submission: bad key hex, non-finite
// numbers, invalid UTF-8, empty canonical bytes. Raised before any network call.
class MalformedInput : public std::runtime_error {
public:
    explicit MalformedInput(const std::string& what) : std::runtime_error(what) {}
};

// Network-level failure in the client. Retrying is the caller's decision.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tessera
