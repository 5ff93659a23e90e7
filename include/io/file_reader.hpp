#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace imgjoin {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    Fd fd_;
};

} // namespace imgjoin
