#include "chronicle/ingest/SnapshotLoader.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/parser/Tokenizer.hh"

#include <zlib.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace chronicle {

namespace {

constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;

// Little-endian field readers; callers check bounds first.
std::uint16_t read16(std::string_view data, size_t offset) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(data[offset]) |
                                      (static_cast<unsigned char>(data[offset + 1]) << 8));
}

std::uint32_t read32(std::string_view data, size_t offset) {
    return static_cast<std::uint32_t>(read16(data, offset)) |
           (static_cast<std::uint32_t>(read16(data, offset + 2)) << 16);
}

struct ZipEntry {
    std::uint16_t method = 0;
    std::uint32_t crc = 0;
    std::uint32_t compressedSize = 0;
    std::uint32_t uncompressedSize = 0;
    std::uint32_t localOffset = 0;
};

Result<ZipEntry> findEntry(std::string_view archive, std::string_view member) {
    if (archive.size() < kEndOfCentralDirSize) {
        return Result<ZipEntry>::error(ErrorCode::ParseFailure, "archive too small");
    }

    // The end record sits at the tail, followed by an optional comment.
    size_t eocd = std::string_view::npos;
    size_t lowest = archive.size() > kEndOfCentralDirSize + 0xFFFF ? archive.size() - kEndOfCentralDirSize - 0xFFFF
                                                                      : 0;
    for (size_t pos = archive.size() - kEndOfCentralDirSize + 1; pos-- > lowest;) {
        if (read32(archive, pos) == kEndOfCentralDirSig) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string_view::npos) {
        return Result<ZipEntry>::error(ErrorCode::ParseFailure, "end of central directory not found");
    }

    std::uint16_t entryCount = read16(archive, eocd + 10);
    size_t cursor = read32(archive, eocd + 16);
    for (std::uint16_t i = 0; i < entryCount; ++i) {
        if (cursor + kCentralHeaderSize > archive.size() || read32(archive, cursor) != kCentralHeaderSig) {
            return Result<ZipEntry>::error(ErrorCode::ParseFailure, "corrupt central directory");
        }
        std::uint16_t nameLength = read16(archive, cursor + 28);
        std::uint16_t extraLength = read16(archive, cursor + 30);
        std::uint16_t commentLength = read16(archive, cursor + 32);
        if (cursor + kCentralHeaderSize + nameLength > archive.size()) {
            return Result<ZipEntry>::error(ErrorCode::ParseFailure, "corrupt central directory");
        }

        if (archive.substr(cursor + kCentralHeaderSize, nameLength) == member) {
            ZipEntry entry;
            entry.method = read16(archive, cursor + 10);
            entry.crc = read32(archive, cursor + 16);
            entry.compressedSize = read32(archive, cursor + 20);
            entry.uncompressedSize = read32(archive, cursor + 24);
            entry.localOffset = read32(archive, cursor + 42);
            return Result<ZipEntry>::ok(entry);
        }
        cursor += kCentralHeaderSize + nameLength + extraLength + commentLength;
    }
    return Result<ZipEntry>::error(ErrorCode::NotFound, "archive has no '" + std::string(member) + "' member");
}

Result<std::string> inflateRaw(std::string_view compressed, size_t expectedSize) {
    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return Result<std::string>::error(ErrorCode::Internal, "inflateInit2 failed");
    }

    std::string out;
    out.reserve(expectedSize);
    char buffer[1 << 16];
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());

    int status = Z_OK;
    while (status != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);
        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) {
            std::string reason = stream.msg ? stream.msg : "inflate error " + std::to_string(status);
            inflateEnd(&stream);
            return Result<std::string>::error(ErrorCode::ParseFailure, "deflate stream: " + reason);
        }
        out.append(buffer, sizeof(buffer) - stream.avail_out);
        if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            return Result<std::string>::error(ErrorCode::ParseFailure, "deflate stream truncated");
        }
    }
    inflateEnd(&stream);
    return Result<std::string>::ok(std::move(out));
}

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCode::IoFailure, "cannot open " + path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::error(ErrorCode::IoFailure, "read error on " + path.string());
    }
    return Result<std::string>::ok(contents.str());
}

bool isZip(std::string_view data) {
    return data.size() >= 4 && read32(data, 0) == kLocalHeaderSig;
}

} // namespace

Result<std::string> SnapshotLoader::extractMember(std::string_view archive, std::string_view member) {
    auto entry = findEntry(archive, member);
    if (entry.isError()) {
        return Result<std::string>::error(entry);
    }
    const ZipEntry& info = entry.value();

    size_t local = info.localOffset;
    if (local + kLocalHeaderSize > archive.size() || read32(archive, local) != kLocalHeaderSig) {
        return Result<std::string>::error(ErrorCode::ParseFailure, "corrupt local header");
    }
    size_t dataStart = local + kLocalHeaderSize + read16(archive, local + 26) + read16(archive, local + 28);
    if (dataStart + info.compressedSize > archive.size()) {
        return Result<std::string>::error(ErrorCode::ParseFailure, "member data runs past end of archive");
    }
    std::string_view data = archive.substr(dataStart, info.compressedSize);

    Result<std::string> contents = Result<std::string>::error(ErrorCode::Internal);
    if (info.method == kMethodStored) {
        contents = Result<std::string>::ok(std::string(data));
    } else if (info.method == kMethodDeflate) {
        contents = inflateRaw(data, info.uncompressedSize);
    } else {
        return Result<std::string>::error(ErrorCode::ParseFailure,
                                          "unsupported compression method " + std::to_string(info.method));
    }
    if (contents.isError()) {
        return contents;
    }

    const std::string& text = contents.value();
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(text.data()), static_cast<uInt>(text.size()));
    if (crc != info.crc) {
        return Result<std::string>::error(ErrorCode::ParseFailure,
                                          "checksum mismatch in '" + std::string(member) + "'");
    }
    return contents;
}

Result<std::string> SnapshotLoader::readText(const std::filesystem::path& path) {
    auto raw = readFile(path);
    if (raw.isError()) {
        return raw;
    }

    std::string text;
    if (isZip(raw.value())) {
        auto member = extractMember(raw.value(), kGamestateMember);
        if (member.isError()) {
            return Result<std::string>::error(member, path.string());
        }
        text = std::move(member.value());
    } else {
        text = std::move(raw.value());
    }

    // UTF-8 byte order mark
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    return Result<std::string>::ok(stripComments(text));
}

Result<Value> SnapshotLoader::load(const std::filesystem::path& path) const {
    auto started = std::chrono::steady_clock::now();
    auto text = readText(path);
    if (text.isError()) {
        return Result<Value>::error(text);
    }

    try {
        Tokenizer tokenizer(text.value());
        Parser parser([&tokenizer] { return tokenizer.next(); }, options_);
        Value gamestate = parser.parseDocument();
        if (parser.skippedComposites() > 0) {
            CHRONICLE_PARSER_LOG_WARN("{}: {} composites deeper than {} levels skipped", path.string(),
                                      parser.skippedComposites(), options_.maxDepth);
        }
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        CHRONICLE_PARSER_LOG_INFO("Parsed {} in {} ms", path.filename().string(), elapsed.count());
        return Result<Value>::ok(std::move(gamestate));
    } catch (const FormatError& e) {
        std::ostringstream oss;
        oss << path.string() << " - " << e.what();
        return Result<Value>::error(ErrorCode::ParseFailure, oss.str());
    }
}

} // namespace chronicle
