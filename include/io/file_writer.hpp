#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace imgjoin {

// Regular-file writer. Open() creates the file or truncates an existing one.
class OutputFileWriter {
public:
    static Result Open(std::string path, OutputFileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in);
    Result FsyncNow();
    Result Close();

    std::uint64_t BytesWritten() const { return written_; }

private:
    std::string path_;
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace imgjoin
