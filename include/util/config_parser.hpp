#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace imgjoin::config {

// Optional JSON settings file. Every field is optional; absent fields keep
// the built-in defaults.
class JoinerConfigFromFile {
public:
    std::optional<std::string> default_output;
    std::optional<std::uint64_t> buffer_size;
    std::optional<bool> fsync_output;
    std::optional<LogLevel> log_level;

    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace imgjoin::config
