#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace imgjoin {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(ErrorKind::Io,
                            "cannot open " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return Result::Fail(ErrorKind::Io,
                            "cannot stat " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::Fail(ErrorKind::Io, "not a regular file: " + out.path_);
    }

    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace imgjoin
