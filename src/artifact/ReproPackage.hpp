#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tessera {

// ---------------------------------------------------------------------------
// ReproPackage: the reproducibility artifact a claim is bound to.
//
// Entries are written as a ustar archive in insertion order with fixed
// metadata (mode 0644, uid/gid 0, mtime 0), so identical inputs always give
// identical bytes and therefore the same artifact_hash.
// ---------------------------------------------------------------------------
class ReproPackage {
public:
    static constexpr const char* MEDIA_TYPE = "application/x-tar";

    // Names must be relative, non-empty and shorter than 100 bytes.
    void add_file(const std::string& name, const std::string& bytes);

    // Checked read of a file on disk. Throws IoError naming `path`.
    void add_file_from_disk(const std::string& name, const std::string& path);

    std::string archive_bytes() const;

    // Throws IoError if the archive cannot be fully written.
    void write(const std::string& out_path) const;

    size_t entry_count() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        std::string bytes;
    };
    std::vector<Entry> entries_;
};

// hyperparameters.json + the training template, written to out_path.
// Returns the archive bytes that were written.
std::string build_repro_package(const nlohmann::json& hyperparameters,
                                const std::string& template_path,
                                const std::string& out_path);

std::string read_file_bytes(const std::string& path);

} // namespace tessera
