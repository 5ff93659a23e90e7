#pragma once

#include "util/config_parser.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace imgjoin::config::detail {

inline constexpr std::uint64_t kMaxBufferSize = 64ULL * 1024 * 1024;

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, JoinerConfigFromFile& cfg, std::string& err);

} // namespace imgjoin::config::detail
