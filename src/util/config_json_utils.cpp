#include "util/config_json_utils.hpp"

#include <fstream>

namespace imgjoin::config::detail {

namespace {

// Each getter returns false only for a present key of the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (!it->is_number_integer())
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, JoinerConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "DefaultOutput", cfg.default_output)) {
        err = "DefaultOutput must be a string";
        return false;
    }
    if (cfg.default_output && cfg.default_output->empty()) {
        err = "DefaultOutput must not be empty";
        return false;
    }

    if (!GetU64IfPresent(j, "BufferSize", cfg.buffer_size) ||
        (cfg.buffer_size && (*cfg.buffer_size == 0 || *cfg.buffer_size > kMaxBufferSize))) {
        err = "BufferSize must be a positive integer <= " + std::to_string(kMaxBufferSize);
        return false;
    }

    if (!GetBoolIfPresent(j, "FsyncOutput", cfg.fsync_output)) {
        err = "FsyncOutput must be a boolean";
        return false;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level)) {
        err = "LogLevel must be a string";
        return false;
    }
    if (level) {
        cfg.log_level = ParseLogLevel(*level);
        if (!cfg.log_level) {
            err = "unknown LogLevel: " + *level;
            return false;
        }
    }

    return true;
}

} // namespace imgjoin::config::detail
