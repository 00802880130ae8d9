#include "runtime/Config.hpp"
#include "core/Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace tessera;

bool tessera::load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.compare(0, 7, "export ") == 0) key = key.substr(7);
        while (!key.empty() && key.back() == ' ') key.pop_back();
        if (key.empty()) continue;

        size_t vs = 0;
        while (vs < value.size() && value[vs] == ' ') vs++;
        if (vs > 0) value = value.substr(vs);

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!std::getenv(key.c_str())) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    std::cout << "[CONFIG] .env loaded from " << path << "\n";
    return true;
}

std::string tessera::env_or(const char* key, const std::string& fallback) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : fallback;
}

int64_t tessera::env_int_or(const char* key, int64_t fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    try {
        size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(key);
        return static_cast<int64_t>(n);
    } catch (const std::exception&) {
        throw MalformedInput(std::string("[CONFIG] ") + key + " is not an integer: " + v);
    }
}

uint64_t tessera::env_uint_or(const char* key, uint64_t fallback) {
    int64_t n = env_int_or(key, static_cast<int64_t>(fallback));
    if (n < 0) throw MalformedInput(std::string("[CONFIG] ") + key + " must not be negative");
    return static_cast<uint64_t>(n);
}

Settings Settings::from_env() {
    Settings s;
    s.server_url       = env_or("TESSERA_SERVER", s.server_url);
    s.key_file         = env_or("TESSERA_KEY_FILE", s.key_file);
    s.template_path    = env_or("TESSERA_TEMPLATE", s.template_path);
    s.task_id          = env_or("TESSERA_TASK_ID", s.task_id);
    s.miner_id         = env_int_or("TESSERA_MINER_ID", s.miner_id);
    s.registry_path    = env_or("TESSERA_REGISTRY", s.registry_path);
    s.max_age_sec      = env_uint_or("TESSERA_MAX_AGE_SEC", s.max_age_sec);
    s.max_skew_sec     = env_uint_or("TESSERA_MAX_SKEW_SEC", s.max_skew_sec);
    s.http_timeout_sec = static_cast<long>(env_uint_or("TESSERA_HTTP_TIMEOUT_SEC",
                                                       static_cast<uint64_t>(s.http_timeout_sec)));
    return s;
}
