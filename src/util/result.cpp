#include "util/result.hpp"

namespace imgjoin {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "ok";
        case ErrorKind::Manifest:     return "manifest";
        case ErrorKind::MissingChunk: return "missing-chunk";
        case ErrorKind::ChunkDigest:  return "chunk-digest";
        case ErrorKind::Io:           return "io";
        case ErrorKind::FinalDigest:  return "final-digest";
        case ErrorKind::Config:       return "config";
    }
    return "unknown";
}

} // namespace imgjoin
