#pragma once
#include <cstdint>
#include <string>

namespace tessera {

// .env loader: KEY=VALUE lines, '#' comments, optional "export " prefix,
// surrounding quotes stripped. Variables already in the environment win.
// Returns false if the file does not exist.
bool load_dotenv(const std::string& path);

std::string env_or(const char* key, const std::string& fallback);

// Throws MalformedInput if the variable is set but not a decimal integer.
int64_t  env_int_or(const char* key, int64_t fallback);
uint64_t env_uint_or(const char* key, uint64_t fallback);

// Settings shared by the command-line programs.
struct Settings {
    std::string server_url{"http://localhost:8080"};
    std::string key_file{"miner_sk.hex"};
    std::string template_path{"templates/train.py"};
    std::string task_id{"task-prod-001"};
    int64_t     miner_id{1};
    std::string registry_path{"miners.json"};
    uint64_t    max_age_sec{300};
    uint64_t    max_skew_sec{60};
    long        http_timeout_sec{30};

    static Settings from_env();
};

} // namespace tessera
