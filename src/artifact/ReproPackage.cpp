#include "artifact/ReproPackage.hpp"
#include "core/Errors.hpp"
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace tessera;

static constexpr size_t BLOCK = 512;

std::string tessera::read_file_bytes(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw IoError("[PKG] cannot open file", path);
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad() || ss.fail()) throw IoError("[PKG] read failed", path);
    return ss.str();
}

// Octal field, zero padded, NUL terminated, exactly `width` bytes.
static void put_octal(char* field, size_t width, uint64_t value) {
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

static void append_header(std::string& out, const std::string& name, uint64_t size) {
    char h[BLOCK];
    std::memset(h, 0, sizeof(h));

    std::memcpy(h, name.data(), name.size());   // name[100]
    put_octal(h + 100, 8, 0644);                // mode
    put_octal(h + 108, 8, 0);                   // uid
    put_octal(h + 116, 8, 0);                   // gid
    put_octal(h + 124, 12, size);               // size
    put_octal(h + 136, 12, 0);                  // mtime
    h[156] = '0';                               // regular file
    std::memcpy(h + 257, "ustar", 6);           // magic incl. NUL
    std::memcpy(h + 263, "00", 2);              // version

    // Checksum is computed with its own field set to spaces.
    std::memset(h + 148, ' ', 8);
    unsigned sum = 0;
    for (size_t i = 0; i < BLOCK; ++i) sum += static_cast<unsigned char>(h[i]);
    std::snprintf(h + 148, 7, "%06o", sum);
    h[154] = '\0';
    h[155] = ' ';

    out.append(h, BLOCK);
}

void ReproPackage::add_file(const std::string& name, const std::string& bytes) {
    if (name.empty() || name.size() >= 100 || name[0] == '/' ||
        name.find("..") != std::string::npos)
        throw MalformedInput("[PKG] invalid archive entry name: " + name);
    for (const auto& e : entries_) {
        if (e.name == name) throw MalformedInput("[PKG] duplicate archive entry: " + name);
    }
    entries_.push_back(Entry{name, bytes});
}

void ReproPackage::add_file_from_disk(const std::string& name, const std::string& path) {
    add_file(name, read_file_bytes(path));
}

std::string ReproPackage::archive_bytes() const {
    std::string out;
    for (const auto& e : entries_) {
        append_header(out, e.name, e.bytes.size());
        out += e.bytes;
        size_t pad = (BLOCK - (e.bytes.size() % BLOCK)) % BLOCK;
        out.append(pad, '\0');
    }
    out.append(2 * BLOCK, '\0');   // end-of-archive marker
    return out;
}

void ReproPackage::write(const std::string& out_path) const {
    std::string bytes = archive_bytes();

    std::ofstream f(out_path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) throw IoError("[PKG] cannot create archive", out_path);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f.good()) throw IoError("[PKG] archive write failed", out_path);
    f.close();
    if (f.fail()) throw IoError("[PKG] archive close failed", out_path);

    std::cout << "[PKG] Wrote " << out_path << " (" << entries_.size()
              << " entries, " << bytes.size() << " bytes)\n";
}

std::string tessera::build_repro_package(const nlohmann::json& hyperparameters,
                                         const std::string& template_path,
                                         const std::string& out_path) {
    if (!hyperparameters.is_object())
        throw MalformedInput("[PKG] hyperparameters must be a JSON object");

    std::string hp_text;
    try {
        hp_text = hyperparameters.dump(2) + "\n";
    } catch (const nlohmann::json::type_error& e) {
        throw MalformedInput(std::string("[PKG] hyperparameters not serializable: ") + e.what());
    }

    ReproPackage pkg;
    pkg.add_file("hyperparameters.json", hp_text);
    pkg.add_file_from_disk("train.py", template_path);
    pkg.write(out_path);
    return pkg.archive_bytes();
}
