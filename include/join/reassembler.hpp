#pragma once

#include "join/manifest.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace imgjoin {

inline constexpr char kDefaultOutputPath[] = "reassembled.img";

struct ReassemblyOptions {
    std::size_t buffer_size = 1024 * 1024;
    bool fsync_output = false;
};

class Reassembler {
public:
    Reassembler() = default;
    explicit Reassembler(ReassemblyOptions options) : options_(options) {}

    // Chunk file names in concatenation order (natural order, not manifest order).
    static std::vector<std::string> ConcatenationOrder(const std::vector<ChunkEntry>& chunks);

    // Truncates `output_path` and appends every chunk in concatenation order.
    Result Run(const SplitManifest& manifest,
               const std::filesystem::path& dir,
               const std::string& output_path,
               std::uint64_t& bytes_written) const;

private:
    ReassemblyOptions options_;
};

} // namespace imgjoin
