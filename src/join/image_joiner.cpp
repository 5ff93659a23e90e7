#include "join/image_joiner.hpp"

#include "join/chunk_verifier.hpp"
#include "join/manifest.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace imgjoin {

ImageJoiner::ImageJoiner() = default;

ImageJoiner::ImageJoiner(ReassemblyOptions options) : options_(options) {}

Result ImageJoiner::Run(const std::string& manifest_path, const std::string& output_path) {
    report_ = FinalReport{};

    ManifestReader reader;
    SplitManifest manifest;
    std::filesystem::path dir;
    auto load = reader.LoadFromFile(manifest_path, manifest, dir);
    if (!load.is_ok())
        return load;

    LogDebug("manifest: original=%s prefix=%s parts=%zu dir=%s",
            manifest.original_file.c_str(),
            manifest.part_prefix.c_str(),
            manifest.chunks.size(),
            dir.c_str());

    LogStatus("[*] Verifying parts...");
    ChunkVerifier verifier;
    ChunkCheckReport chunk_report;
    auto check = verifier.VerifyAll(manifest, dir, chunk_report);
    if (!check.is_ok())
        return check;
    LogDebug("verified %zu parts, %llu bytes",
             chunk_report.verified,
             (unsigned long long)chunk_report.verified_bytes);

    LogStatus("[*] Concatenating parts into %s ...", output_path.c_str());
    Reassembler reassembler(options_);
    std::uint64_t written = 0;
    auto join = reassembler.Run(manifest, dir, output_path, written);
    if (!join.is_ok())
        return join;
    LogDebug("wrote %llu bytes to %s", (unsigned long long)written, output_path.c_str());

    LogStatus("[*] Verifying final image checksum and size...");
    FinalVerifier final_verifier;
    return final_verifier.Verify(manifest, output_path, report_);
}

} // namespace imgjoin
