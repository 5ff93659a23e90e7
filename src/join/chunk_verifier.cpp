#include "join/chunk_verifier.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <system_error>

namespace imgjoin {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

Result ChunkVerifier::VerifyAll(const SplitManifest& manifest,
                                const std::filesystem::path& dir,
                                ChunkCheckReport& report) const {
    report = ChunkCheckReport{};

    for (const auto& chunk : manifest.chunks) {
        const auto path = ResolveInDirectory(dir, chunk.file_name);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            LogStatus("Missing: %s", chunk.file_name.c_str());
            report.missing.push_back(chunk.file_name);
            continue;
        }

        std::string actual;
        auto hr = Sha256HexFile(path.string(), actual);
        if (!hr.ok)
            return hr;

        if (!DigestsEqual(actual, chunk.sha256)) {
            LogStatus("Checksum mismatch: %s", chunk.file_name.c_str());
            LogStatus(" expected: %s", chunk.sha256.c_str());
            LogStatus("   actual: %s", actual.c_str());
            return Result::Fail(ErrorKind::ChunkDigest,
                                "checksum mismatch for chunk " + chunk.file_name +
                                    ": expected=" + chunk.sha256 + " actual=" + actual);
        }

        const auto size = std::filesystem::file_size(path, ec);
        if (!ec) report.verified_bytes += size;
        ++report.verified;
        LogDebug("chunk %s ok (%s)", chunk.file_name.c_str(), actual.c_str());
    }

    if (!report.missing.empty()) {
        return Result::Fail(ErrorKind::MissingChunk,
                            "missing parts (" + std::to_string(report.missing.size()) + " of " +
                                std::to_string(manifest.chunks.size()) + "): " +
                                JoinNames(report.missing) + ". Aborting.");
    }

    return Result::Ok();
}

} // namespace imgjoin
