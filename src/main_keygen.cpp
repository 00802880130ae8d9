// tessera_keygen: create a miner identity.
//
//   tessera_keygen <key_file> [--miner-id N] [--registry miners.json]
//
// Writes the hex seed to <key_file> (mode 0600, never overwritten) and prints
// the public key. With --registry the miner_id -> public key binding is added
// to the verifier's registry file.
#include <fstream>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

#include "crypto/Ed25519Key.hpp"
#include "core/Errors.hpp"

using namespace tessera;

static void add_to_registry(const std::string& path, long long miner_id, const std::string& pub_hex) {
    nlohmann::json reg = nlohmann::json::object();
    {
        std::ifstream in(path);
        if (in.is_open()) {
            try {
                in >> reg;
            } catch (const nlohmann::json::exception& e) {
                throw MalformedInput("[KEYGEN] registry " + path + " is not valid json: " + e.what());
            }
            if (!reg.is_object()) throw MalformedInput("[KEYGEN] registry " + path + " is not an object");
        }
    }
    reg[std::to_string(miner_id)] = pub_hex;

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw IoError("[KEYGEN] cannot write registry", path);
    out << reg.dump(2) << "\n";
    out.flush();
    if (!out.good()) throw IoError("[KEYGEN] registry write failed", path);
    std::cout << "[KEYGEN] Bound miner " << miner_id << " in " << path << "\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: tessera_keygen <key_file> [--miner-id N] [--registry miners.json]\n";
        return 2;
    }

    std::string key_file = argv[1];
    long long   miner_id = -1;
    std::string registry;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--miner-id" && i + 1 < argc) {
            try {
                miner_id = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "[KEYGEN] --miner-id must be an integer\n";
                return 2;
            }
        } else if (a == "--registry" && i + 1 < argc) registry = argv[++i];
        else {
            std::cerr << "[KEYGEN] unknown argument " << a << "\n";
            return 2;
        }
    }
    if (!registry.empty() && miner_id < 0) {
        std::cerr << "[KEYGEN] --registry needs --miner-id\n";
        return 2;
    }

    try {
        IdentityKey key = IdentityKey::generate();
        key.save(key_file);
        std::cout << "[KEYGEN] Private key written to " << key_file << "\n";
        std::cout << "public key: " << key.public_key_hex() << "\n";
        if (!registry.empty()) add_to_registry(registry, miner_id, key.public_key_hex());
    } catch (const std::exception& e) {
        std::cerr << "[KEYGEN] FAILED: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
