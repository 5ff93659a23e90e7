#pragma once

#include "join/final_verifier.hpp"
#include "join/reassembler.hpp"
#include "util/result.hpp"

#include <string>

namespace imgjoin {

// Runs manifest parsing, chunk verification, concatenation and final
// verification in that order, stopping at the first fatal failure.
class ImageJoiner {
public:
    ImageJoiner();
    explicit ImageJoiner(ReassemblyOptions options);

    Result Run(const std::string& manifest_path, const std::string& output_path);

    // Valid after a successful Run().
    const FinalReport& Report() const { return report_; }

private:
    ReassemblyOptions options_;
    FinalReport report_;
};

} // namespace imgjoin
