#include "join/reassembler.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/natural_order.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <span>

namespace imgjoin {

namespace {

Result AppendChunk(const std::string& path, OutputFileWriter& writer, std::vector<std::uint8_t>& buf) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok)
        return r;

    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return Result::Fail(ErrorKind::Io, "read failed: " + path);

        auto w = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!w.ok)
            return w;
    }
    return Result::Ok();
}

} // namespace

std::vector<std::string> Reassembler::ConcatenationOrder(const std::vector<ChunkEntry>& chunks) {
    std::vector<std::string> names;
    names.reserve(chunks.size());
    for (const auto& c : chunks) {
        names.push_back(c.file_name);
    }
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return NaturalOrder::Less(a, b);
    });
    return names;
}

Result Reassembler::Run(const SplitManifest& manifest,
                        const std::filesystem::path& dir,
                        const std::string& output_path,
                        std::uint64_t& bytes_written) const {
    bytes_written = 0;
    if (options_.buffer_size == 0)
        return Result::Fail(ErrorKind::Config, "copy buffer size must be > 0");

    OutputFileWriter writer;
    auto open = OutputFileWriter::Open(output_path, writer);
    if (!open.ok)
        return open;

    std::vector<std::uint8_t> buf(options_.buffer_size);
    for (const auto& name : ConcatenationOrder(manifest.chunks)) {
        const auto path = ResolveInDirectory(dir, name).string();
        const std::uint64_t before = writer.BytesWritten();
        auto r = AppendChunk(path, writer, buf);
        if (!r.ok)
            return r;
        LogDebug("appended %s (%llu bytes)",
                 name.c_str(),
                 (unsigned long long)(writer.BytesWritten() - before));
    }

    if (options_.fsync_output) {
        auto s = writer.FsyncNow();
        if (!s.ok)
            return s;
    }

    bytes_written = writer.BytesWritten();
    return writer.Close();
}

} // namespace imgjoin
