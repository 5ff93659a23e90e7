#pragma once

#include "join/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace imgjoin {

struct ChunkCheckReport {
    std::vector<std::string> missing;
    std::size_t verified = 0;
    std::uint64_t verified_bytes = 0;
};

// Checks every listed chunk against its recorded digest. Missing chunks are
// collected and reported together; a digest mismatch stops immediately.
class ChunkVerifier {
public:
    Result VerifyAll(const SplitManifest& manifest,
                     const std::filesystem::path& dir,
                     ChunkCheckReport& report) const;
};

} // namespace imgjoin
