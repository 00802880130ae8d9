// tessera_verify: check a captured wire unit offline.
//
//   tessera_verify <wire.bin> [--content-type "multipart/form-data; boundary=..."]
//
// The content type defaults to the contents of <wire.bin>.ctype. The miner
// registry and freshness window come from the environment / .env.
// Prints the verdict JSON. Exit: 0 accepted, 1 rejected, 2 local failure.
#include <iostream>
#include <string>

#include "artifact/ReproPackage.hpp"
#include "runtime/Config.hpp"
#include "verify/MinerRegistry.hpp"
#include "verify/NonceLedger.hpp"
#include "verify/SubmissionVerifier.hpp"

using namespace tessera;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: tessera_verify <wire.bin> [--content-type CT]\n";
        return 2;
    }
    std::string wire_path = argv[1];
    std::string content_type;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--content-type" && i + 1 < argc) content_type = argv[++i];
        else {
            std::cerr << "[VERIFY] unknown argument " << a << "\n";
            return 2;
        }
    }

    load_dotenv(".env");
    load_dotenv("../.env");

    try {
        Settings cfg = Settings::from_env();

        MinerRegistry registry;
        MinerRegistry::load_file(registry, cfg.registry_path);

        FreshnessWindow window;
        window.max_age_sec         = cfg.max_age_sec;
        window.max_future_skew_sec = cfg.max_skew_sec;
        NonceLedger ledger(window.max_age_sec);
        SubmissionVerifier verifier(registry, ledger, window);

        std::string body = read_file_bytes(wire_path);
        if (content_type.empty()) {
            content_type = read_file_bytes(wire_path + ".ctype");
            while (!content_type.empty() &&
                   (content_type.back() == '\n' || content_type.back() == '\r'))
                content_type.pop_back();
        }

        Verdict v = verifier.verify_body(body, content_type);
        std::cout << v.to_json().dump() << "\n";
        return v.accepted() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[VERIFY] FAILED: " << e.what() << "\n";
        return 2;
    }
}
