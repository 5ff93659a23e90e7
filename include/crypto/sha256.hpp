#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace imgjoin {

inline constexpr std::size_t kSha256HexLength = 64;
inline constexpr std::size_t kDigestBufferSize = 64 * 1024;

std::string Sha256Hex(std::span<const std::uint8_t> data);
Result Sha256Hex(IReader& reader, std::string& out_hex);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

// Case-insensitive comparison of two hex digests.
bool DigestsEqual(std::string_view lhs, std::string_view rhs);
bool IsSha256Hex(std::string_view s);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    bool Update(std::span<const std::uint8_t> data);
    // Empty string if the hasher failed or was already finalized.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace imgjoin
