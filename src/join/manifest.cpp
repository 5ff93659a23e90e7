#include "join/manifest.hpp"

#include "crypto/sha256.hpp"
#include "util/path_utils.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <unordered_set>

namespace imgjoin {

namespace {

struct ManifestLine {
    size_t number = 0;
    std::string_view text;
};

std::string_view StripCr(std::string_view s) {
    if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
    return s;
}

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::vector<ManifestLine> SplitLines(const std::string& text) {
    std::vector<ManifestLine> lines;
    std::string_view rest(text);
    size_t number = 1;
    while (!rest.empty()) {
        const auto nl = rest.find('\n');
        lines.push_back({number++, StripCr(rest.substr(0, nl))});
        if (nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }
    return lines;
}

std::vector<std::string_view> SplitWhitespace(std::string_view s) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
        if (i >= s.size()) break;
        const size_t start = i;
        while (i < s.size() && s[i] != ' ' && s[i] != '\t') ++i;
        tokens.push_back(s.substr(start, i - start));
    }
    return tokens;
}

bool IsMarker(std::string_view line, const char* marker) {
    return Trim(line) == marker;
}

// Lines outside PARTS_BEGIN/PARTS_END, and the lines inside them.
struct Sections {
    std::vector<ManifestLine> header;
    std::vector<ManifestLine> parts;
    bool saw_begin = false;
    bool saw_end = false;
};

Sections SplitSections(const std::vector<ManifestLine>& lines) {
    Sections s;
    bool inside = false;
    for (const auto& line : lines) {
        if (!inside && !s.saw_begin && IsMarker(line.text, kPartsBegin)) {
            inside = true;
            s.saw_begin = true;
            continue;
        }
        if (inside && IsMarker(line.text, kPartsEnd)) {
            inside = false;
            s.saw_end = true;
            continue;
        }
        if (inside) {
            s.parts.push_back(line);
        } else {
            s.header.push_back(line);
        }
    }
    return s;
}

std::optional<std::string> FindKey(const std::vector<ManifestLine>& header, std::string_view key) {
    for (const auto& line : header) {
        const auto& t = line.text;
        if (t.size() > key.size() && t.compare(0, key.size(), key) == 0 && t[key.size()] == '=') {
            return std::string(t.substr(key.size() + 1));
        }
    }
    return std::nullopt;
}

std::expected<std::optional<std::uint64_t>, std::string> ParseSize(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) return std::optional<std::uint64_t>{};

    std::uint64_t v = 0;
    const char* begin = raw->data();
    const char* end = begin + raw->size();
    auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc() || ptr != end) {
        return std::unexpected("invalid ORIGINAL_SIZE: " + *raw);
    }
    return std::optional<std::uint64_t>{v};
}

std::expected<std::vector<ChunkEntry>, std::string> ParseParts(const std::vector<ManifestLine>& parts) {
    std::vector<ChunkEntry> out;
    std::unordered_set<std::string> seen;

    for (const auto& line : parts) {
        const auto tokens = SplitWhitespace(line.text);
        if (tokens.empty()) continue;

        const std::string where = "line " + std::to_string(line.number);
        if (tokens.size() != 2) {
            return std::unexpected(where + ": expected '<chunk> <sha256>', got " +
                                   std::to_string(tokens.size()) + " fields");
        }

        ChunkEntry c;
        c.file_name = std::string(tokens[0]);
        c.sha256 = std::string(tokens[1]);

        if (!IsSafeRelativeName(c.file_name)) {
            return std::unexpected(where + ": chunk name escapes manifest directory: " + c.file_name);
        }
        if (!IsSha256Hex(c.sha256)) {
            return std::unexpected(where + ": invalid sha256 for " + c.file_name);
        }
        if (!seen.insert(c.file_name).second) {
            return std::unexpected(where + ": duplicate chunk " + c.file_name);
        }
        out.push_back(std::move(c));
    }

    return out;
}

} // namespace

std::expected<SplitManifest, std::string> ManifestReader::Parse(const std::string& text) const {
    const auto sections = SplitSections(SplitLines(text));

    SplitManifest m;
    m.format = FindKey(sections.header, "FORMAT").value_or("");
    if (m.format != kManifestFormat) {
        return std::unexpected("unsupported manifest format: " + m.format);
    }

    m.original_file = FindKey(sections.header, "ORIGINAL_FILE").value_or("");
    m.part_prefix = FindKey(sections.header, "PART_PREFIX").value_or("");
    m.original_sha256 = FindKey(sections.header, "ORIGINAL_SHA256").value_or("");

    auto size = ParseSize(FindKey(sections.header, "ORIGINAL_SIZE"));
    if (!size)
        return std::unexpected(size.error());
    m.original_size = *size;

    if (!IsSha256Hex(m.original_sha256)) {
        return std::unexpected(m.original_sha256.empty()
                                   ? std::string("missing ORIGINAL_SHA256")
                                   : "invalid ORIGINAL_SHA256: " + m.original_sha256);
    }

    if (sections.saw_begin && !sections.saw_end) {
        return std::unexpected(std::string(kPartsBegin) + " without " + kPartsEnd);
    }

    auto chunks = ParseParts(sections.parts);
    if (!chunks)
        return std::unexpected(chunks.error());
    if (chunks->empty()) {
        return std::unexpected("no parts listed in manifest");
    }
    m.chunks = std::move(*chunks);

    return m;
}

Result ManifestReader::LoadFromFile(const std::string& path,
                                    SplitManifest& out,
                                    std::filesystem::path& manifest_dir) const {
    namespace fs = std::filesystem;

    const fs::path abs(AbsolutePathString(path));
    std::error_code ec;
    if (!fs::is_regular_file(abs, ec)) {
        return Result::Fail(ErrorKind::Manifest, "manifest not found: " + abs.string());
    }

    std::ifstream is(abs, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Manifest, "cannot open manifest: " + abs.string());
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    if (is.bad()) {
        return Result::Fail(ErrorKind::Io, "read failed: " + abs.string());
    }

    auto parsed = Parse(ss.str());
    if (!parsed)
        return Result::Fail(ErrorKind::Manifest, parsed.error() + " (" + abs.string() + ")");

    out = std::move(*parsed);
    manifest_dir = abs.parent_path();
    return Result::Ok();
}

} // namespace imgjoin
