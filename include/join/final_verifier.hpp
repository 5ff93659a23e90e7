#pragma once

#include "join/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace imgjoin {

struct FinalReport {
    std::string sha256;
    std::uint64_t size = 0;
    bool size_mismatch = false;
    std::string absolute_path;
};

// Digest mismatch fails the run and leaves the output in place; a size
// mismatch is only a warning.
class FinalVerifier {
public:
    Result Verify(const SplitManifest& manifest,
                  const std::string& output_path,
                  FinalReport& report) const;
};

} // namespace imgjoin
