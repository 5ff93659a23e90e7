#pragma once
#include <string>
#include <utility>

namespace imgjoin {

enum class ErrorKind : int {
    None = 0,
    Manifest = 1,
    MissingChunk = 2,
    ChunkDigest = 3,
    Io = 4,
    FinalDigest = 5,
    Config = 6,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    ErrorKind kind() const { return static_cast<ErrorKind>(err); }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m) {
        return Fail(static_cast<int>(k), std::move(m));
    }
};

} // namespace imgjoin
