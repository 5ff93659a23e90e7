#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgjoin {

inline constexpr char kManifestFormat[] = "img-split-v1";
inline constexpr char kPartsBegin[] = "PARTS_BEGIN";
inline constexpr char kPartsEnd[] = "PARTS_END";

struct ChunkEntry {
    std::string file_name;
    std::string sha256;
};

struct SplitManifest {
    std::string format;
    std::string original_file;
    std::optional<std::uint64_t> original_size;
    std::string original_sha256;
    std::string part_prefix;
    std::vector<ChunkEntry> chunks;
};

class ManifestReader {
public:
    std::expected<SplitManifest, std::string> Parse(const std::string& text) const;

    // Reads and parses `path`. `manifest_dir` receives the absolute directory
    // that chunk names are resolved against.
    Result LoadFromFile(const std::string& path,
                        SplitManifest& out,
                        std::filesystem::path& manifest_dir) const;
};

} // namespace imgjoin
