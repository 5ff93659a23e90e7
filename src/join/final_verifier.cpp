#include "join/final_verifier.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace imgjoin {

Result FinalVerifier::Verify(const SplitManifest& manifest,
                             const std::string& output_path,
                             FinalReport& report) const {
    report = FinalReport{};

    auto hr = Sha256HexFile(output_path, report.sha256);
    if (!hr.ok)
        return hr;

    struct stat st{};
    if (::stat(output_path.c_str(), &st) != 0) {
        return Result::Fail(ErrorKind::Io,
                            "cannot stat " + output_path + " (" + std::strerror(errno) + ")");
    }
    report.size = static_cast<std::uint64_t>(st.st_size);
    report.absolute_path = AbsolutePathString(output_path);

    if (!DigestsEqual(report.sha256, manifest.original_sha256)) {
        LogStatus("Final SHA-256 mismatch");
        LogStatus(" expected: %s", manifest.original_sha256.c_str());
        LogStatus("   actual: %s", report.sha256.c_str());
        return Result::Fail(ErrorKind::FinalDigest,
                            "final SHA-256 mismatch: expected=" + manifest.original_sha256 +
                                " actual=" + report.sha256 + " (output kept at " +
                                report.absolute_path + ")");
    }

    if (manifest.original_size && *manifest.original_size != report.size) {
        report.size_mismatch = true;
        LogStatusWarn("Warning: size mismatch");
        LogStatusWarn(" manifest: %llu", (unsigned long long)*manifest.original_size);
        LogStatusWarn("   actual: %llu", (unsigned long long)report.size);
    } else {
        LogStatus("[\xE2\x9C\x93] Reassembled image verified.");
    }

    LogStatus("Output image: %s", report.absolute_path.c_str());
    return Result::Ok();
}

} // namespace imgjoin
