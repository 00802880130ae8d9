// tessera_submit: package, claim, sign and send one training result.
//
//   tessera_submit [--hyper params.json] [--artifact repro.tar]
//                  [--fetch-task] [--save wire.bin]
//
// Settings come from the environment / .env (see runtime/Config.hpp).
// --save writes the encoded wire unit (and <file>.ctype) instead of sending.
// Exit: 0 accepted or saved, 1 rejected, 2 local/transport failure.
#include <fstream>
#include <iostream>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "artifact/ReproPackage.hpp"
#include "auth/MinerAuth.hpp"
#include "claim/Claim.hpp"
#include "core/Errors.hpp"
#include "crypto/Ed25519Key.hpp"
#include "crypto/Sha256Stream.hpp"
#include "runtime/Config.hpp"
#include "submission/Multipart.hpp"
#include "submission/SubmissionAssembler.hpp"
#include "submission/SubmissionClient.hpp"
#include "training/ReferenceTrainer.hpp"

using namespace tessera;
using json = nlohmann::json;

static void write_all(const std::string& path, const std::string& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) throw IoError("[SUBMIT] cannot create file", path);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f.good()) throw IoError("[SUBMIT] write failed", path);
}

int main(int argc, char** argv) {
    std::string hyper_path;
    std::string artifact_path = "repro.tar";
    std::string save_path;
    bool        fetch_task = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--hyper" && i + 1 < argc)         hyper_path = argv[++i];
        else if (a == "--artifact" && i + 1 < argc) artifact_path = argv[++i];
        else if (a == "--save" && i + 1 < argc)     save_path = argv[++i];
        else if (a == "--fetch-task")               fetch_task = true;
        else {
            std::cerr << "[SUBMIT] unknown argument " << a << "\n";
            return 2;
        }
    }

    load_dotenv(".env");
    load_dotenv("../.env");
    curl_global_init(CURL_GLOBAL_ALL);

    int rc = 2;
    try {
        Settings cfg = Settings::from_env();

        // Identity is built once and only passed by reference from here on.
        IdentityKey key = IdentityKey::load(cfg.key_file);
        MinerAuth   auth(cfg.miner_id, key);

        json hyper = {{"layers", {128, 64}}, {"activation", "relu"}, {"lr", 0.001}};
        if (!hyper_path.empty()) {
            std::ifstream in(hyper_path);
            if (!in.is_open()) throw IoError("[SUBMIT] cannot open hyperparameters", hyper_path);
            try {
                in >> hyper;
            } catch (const json::exception& e) {
                throw MalformedInput("[SUBMIT] invalid hyperparameters json: " + std::string(e.what()));
            }
        }

        std::string task_id = cfg.task_id;
        if (fetch_task && save_path.empty()) {
            SubmissionClient probe(cfg.server_url, cfg.http_timeout_sec);
            task_id = probe.fetch_task().task_id;
        }

        build_repro_package(hyper, cfg.template_path, artifact_path);
        const std::string artifact_hash = Sha256Stream::hash_file(artifact_path);
        std::cout << "[SUBMIT] artifact " << artifact_path << " sha256=" << artifact_hash << "\n";

        const double performance = ReferenceTrainer::score(hyper);

        SubmissionAssembler assembler(auth);
        Claim claim = assembler.make_claim(task_id, performance, hyper, artifact_hash);

        // Re-read what was hashed so the bytes sent are the bytes claimed.
        const std::string artifact_bytes = read_file_bytes(artifact_path);
        WireSubmission wire = assembler.assemble(claim, artifact_bytes, "repro.tar",
                                                 ReproPackage::MEDIA_TYPE);

        if (!save_path.empty()) {
            EncodedBody enc = encode_multipart(wire);
            write_all(save_path, enc.body);
            write_all(save_path + ".ctype", enc.content_type);
            std::cout << "[SUBMIT] Wire unit saved to " << save_path << "\n";
            rc = 0;
        } else {
            SubmissionClient client(cfg.server_url, cfg.http_timeout_sec);
            Verdict v = client.submit(wire);
            std::cout << v.to_json().dump() << "\n";
            rc = v.accepted() ? 0 : 1;
        }
    } catch (const IoError& e) {
        std::cerr << "[SUBMIT] I/O error: " << e.what() << "\n";
    } catch (const MalformedInput& e) {
        std::cerr << "[SUBMIT] invalid input: " << e.what() << "\n";
    } catch (const TransportError& e) {
        std::cerr << "[SUBMIT] transport failure (retryable): " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[SUBMIT] FAILED: " << e.what() << "\n";
    }

    curl_global_cleanup();
    return rc;
}
