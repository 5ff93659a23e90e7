#include "join/chunk_verifier.hpp"
#include "testing.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

namespace imgjoin {
namespace {

class ChunkVerifierTests : public ::testing::Test {
protected:
    void SetUp() override { Logger::Instance().SetLevel(LogLevel::Error); }
    void TearDown() override { Logger::Instance().SetLevel(LogLevel::Info); }

    SplitManifest LoadManifest(const std::string& path, std::filesystem::path& dir) {
        SplitManifest m;
        auto r = ManifestReader{}.LoadFromFile(path, m, dir);
        EXPECT_TRUE(r.ok) << r.msg;
        return m;
    }

    testutil::TemporaryDirectory tmp;
};

TEST_F(ChunkVerifierTests, AllPresentAndMatching) {
    const std::string original = testutil::MakePayload(5000, 3);
    const auto parts = testutil::SplitEvenly(original, 4, "disk.img.part");
    const auto manifest_path = testutil::WriteSplit(tmp, parts, original);

    std::filesystem::path dir;
    const auto m = LoadManifest(manifest_path, dir);

    ChunkCheckReport report;
    const auto res = ChunkVerifier{}.VerifyAll(m, dir, report);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_TRUE(report.missing.empty());
    EXPECT_EQ(report.verified, 4u);
    EXPECT_EQ(report.verified_bytes, original.size());
}

TEST_F(ChunkVerifierTests, ReportsEveryMissingChunk) {
    const std::string original = testutil::MakePayload(1000, 5);
    const auto parts = testutil::SplitEvenly(original, 5, "p");
    const auto manifest_path = testutil::WriteSplit(tmp, parts, original);
    ASSERT_EQ(::unlink(tmp.Join("p2").c_str()), 0);
    ASSERT_EQ(::unlink(tmp.Join("p4").c_str()), 0);
    ASSERT_EQ(::unlink(tmp.Join("p5").c_str()), 0);

    std::filesystem::path dir;
    const auto m = LoadManifest(manifest_path, dir);

    ChunkCheckReport report;
    const auto res = ChunkVerifier{}.VerifyAll(m, dir, report);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind(), ErrorKind::MissingChunk);
    const std::vector<std::string> expected = {"p2", "p4", "p5"};
    EXPECT_EQ(report.missing, expected);
    EXPECT_EQ(report.verified, 2u);
    EXPECT_NE(res.msg.find("3 of 5"), std::string::npos);
    EXPECT_NE(res.msg.find("p2, p4, p5"), std::string::npos);
}

TEST_F(ChunkVerifierTests, DigestMismatchAbortsImmediately) {
    const std::string original = testutil::MakePayload(900, 11);
    const auto parts = testutil::SplitEvenly(original, 3, "p");
    const auto manifest_path = testutil::WriteSplit(tmp, parts, original);

    // p1 corrupt, p3 missing: the mismatch is reported before the loop gets to p3
    ASSERT_TRUE(testutil::WriteFile(tmp.Join("p1"), "corrupted"));
    ASSERT_EQ(::unlink(tmp.Join("p3").c_str()), 0);

    std::filesystem::path dir;
    const auto m = LoadManifest(manifest_path, dir);

    ChunkCheckReport report;
    const auto res = ChunkVerifier{}.VerifyAll(m, dir, report);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind(), ErrorKind::ChunkDigest);
    EXPECT_NE(res.msg.find("p1"), std::string::npos);
    EXPECT_NE(res.msg.find("expected=" + testutil::Sha256Of(parts[0].contents)), std::string::npos);
    EXPECT_NE(res.msg.find("actual=" + testutil::Sha256Of("corrupted")), std::string::npos);
    EXPECT_TRUE(report.missing.empty());
}

TEST_F(ChunkVerifierTests, SwappedChunkContentIsCaught) {
    const std::string original = testutil::MakePayload(2000, 13);
    const auto parts = testutil::SplitEvenly(original, 2, "p");
    const auto manifest_path = testutil::WriteSplit(tmp, parts, original);

    ASSERT_TRUE(testutil::WriteFile(tmp.Join("p1"), parts[1].contents));
    ASSERT_TRUE(testutil::WriteFile(tmp.Join("p2"), parts[0].contents));

    std::filesystem::path dir;
    const auto m = LoadManifest(manifest_path, dir);

    ChunkCheckReport report;
    const auto res = ChunkVerifier{}.VerifyAll(m, dir, report);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind(), ErrorKind::ChunkDigest);
}

TEST_F(ChunkVerifierTests, UppercaseManifestDigestMatches) {
    const std::string payload = "chunk-data";
    std::string upper = testutil::Sha256Of(payload);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    ASSERT_TRUE(testutil::WriteFile(tmp.Join("p1"), payload));

    SplitManifest m;
    m.format = kManifestFormat;
    m.chunks.push_back({"p1", upper});

    ChunkCheckReport report;
    const auto res = ChunkVerifier{}.VerifyAll(m, tmp.Path(), report);
    ASSERT_TRUE(res.ok) << res.msg;
}

TEST_F(ChunkVerifierTests, DirectoryInPlaceOfChunkCountsAsMissing) {
    ASSERT_EQ(::mkdir(tmp.Join("p1").c_str(), 0755), 0);

    SplitManifest m;
    m.chunks.push_back({"p1", std::string(64, 'a')});

    ChunkCheckReport report;
    const auto res = ChunkVerifier{}.VerifyAll(m, tmp.Path(), report);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind(), ErrorKind::MissingChunk);
    ASSERT_EQ(report.missing.size(), 1u);
}

} // namespace
} // namespace imgjoin
