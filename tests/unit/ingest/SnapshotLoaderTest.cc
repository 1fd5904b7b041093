#include "chronicle/ingest/SnapshotLoader.hh"
#include <gtest/gtest.h>

#include <zlib.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace chronicle;

namespace {

struct ZipMember {
    std::string name;
    std::string contents;
    bool deflate = true;
};

void put16(std::string& out, std::uint32_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void put32(std::string& out, std::uint32_t value) {
    put16(out, value & 0xFFFF);
    put16(out, value >> 16);
}

std::string deflateRaw(const std::string& input) {
    z_stream stream{};
    deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    std::string out(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    deflate(&stream, Z_FINISH);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

// Minimal zip writer: local headers, central directory, end record.
std::string makeZip(const std::vector<ZipMember>& members) {
    std::string archive;
    std::string central;
    for (const auto& member : members) {
        std::string data = member.deflate ? deflateRaw(member.contents) : member.contents;
        auto crc = static_cast<std::uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(member.contents.data()), static_cast<uInt>(member.contents.size())));
        std::uint32_t method = member.deflate ? 8 : 0;
        auto offset = static_cast<std::uint32_t>(archive.size());

        put32(archive, 0x04034b50);
        put16(archive, 20);
        put16(archive, 0);
        put16(archive, method);
        put16(archive, 0);
        put16(archive, 0);
        put32(archive, crc);
        put32(archive, static_cast<std::uint32_t>(data.size()));
        put32(archive, static_cast<std::uint32_t>(member.contents.size()));
        put16(archive, static_cast<std::uint32_t>(member.name.size()));
        put16(archive, 0);
        archive += member.name;
        archive += data;

        put32(central, 0x02014b50);
        put16(central, 20);
        put16(central, 20);
        put16(central, 0);
        put16(central, method);
        put16(central, 0);
        put16(central, 0);
        put32(central, crc);
        put32(central, static_cast<std::uint32_t>(data.size()));
        put32(central, static_cast<std::uint32_t>(member.contents.size()));
        put16(central, static_cast<std::uint32_t>(member.name.size()));
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put32(central, 0);
        put32(central, offset);
        central += member.name;
    }

    auto centralOffset = static_cast<std::uint32_t>(archive.size());
    archive += central;
    put32(archive, 0x06054b50);
    put16(archive, 0);
    put16(archive, 0);
    put16(archive, static_cast<std::uint32_t>(members.size()));
    put16(archive, static_cast<std::uint32_t>(members.size()));
    put32(archive, static_cast<std::uint32_t>(central.size()));
    put32(archive, centralOffset);
    put16(archive, 0);
    return archive;
}

const std::string kGamestate = "version=\"Test v3.0.0\"\ndate=\"2200.05.01\"\n"
                               "country={ 0={ name=\"Earth\" } }\n";

} // namespace

class SnapshotLoaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "chronicle_loader_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override { std::filesystem::remove_all(tempDir_); }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = tempDir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::filesystem::path tempDir_;
    SnapshotLoader loader_;
};

TEST_F(SnapshotLoaderTest, LoadsDeflatedGamestate) {
    auto path = writeFile("autosave.sav", makeZip({{"meta", "version=\"x\"", true}, {"gamestate", kGamestate, true}}));

    auto result = loader_.load(path);
    ASSERT_TRUE(result.isOk()) << result.message();
    const Value& gamestate = result.value();
    EXPECT_EQ(getStringOr(gamestate, "date", ""), "2200.05.01");
    const auto* earth = gamestate.get("country")->get(std::int64_t{0});
    ASSERT_NE(earth, nullptr);
    EXPECT_EQ(getStringOr(*earth, "name", ""), "Earth");
}

TEST_F(SnapshotLoaderTest, LoadsStoredMember) {
    auto archive = makeZip({{"gamestate", kGamestate, false}});
    auto text = SnapshotLoader::extractMember(archive, "gamestate");
    ASSERT_TRUE(text.isOk()) << text.message();
    EXPECT_EQ(text.value(), kGamestate);
}

TEST_F(SnapshotLoaderTest, LoadsPlainTextWithCommentsAndBom) {
    auto path = writeFile("plain.sav", "\xEF\xBB\xBF# exported by hand\n" + kGamestate);
    auto text = SnapshotLoader::readText(path);
    ASSERT_TRUE(text.isOk()) << text.message();
    EXPECT_EQ(text.value().find('#'), std::string::npos);

    auto result = loader_.load(path);
    ASSERT_TRUE(result.isOk()) << result.message();
    EXPECT_EQ(getStringOr(result.value(), "version", ""), "Test v3.0.0");
}

TEST_F(SnapshotLoaderTest, MissingGamestateMember) {
    auto path = writeFile("meta_only.sav", makeZip({{"meta", "version=\"x\"", true}}));
    auto result = loader_.load(path);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
    EXPECT_NE(result.message().find("meta_only.sav"), std::string::npos);
}

TEST_F(SnapshotLoaderTest, ChecksumMismatch) {
    auto archive = makeZip({{"gamestate", kGamestate, false}});
    // Flip one byte of the stored member data.
    auto at = archive.find("Test v3");
    ASSERT_NE(at, std::string::npos);
    archive[at] = 'X';

    auto result = SnapshotLoader::extractMember(archive, "gamestate");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::ParseFailure);
    EXPECT_NE(result.message().find("checksum"), std::string::npos);
}

TEST_F(SnapshotLoaderTest, TruncatedArchive) {
    auto archive = makeZip({{"gamestate", kGamestate, true}});
    auto result = SnapshotLoader::extractMember(archive.substr(0, 10), "gamestate");
    EXPECT_EQ(result.code(), ErrorCode::ParseFailure);
}

TEST_F(SnapshotLoaderTest, MissingFile) {
    auto result = loader_.load(tempDir_ / "nope.sav");
    EXPECT_EQ(result.code(), ErrorCode::IoFailure);
}

TEST_F(SnapshotLoaderTest, GrammarErrorNamesFileAndLine) {
    auto path = writeFile("broken.sav", "date=\"2200.01.01\"\ncountry={ 0={ name=\"Earth\" }\n}\n}\n");
    auto result = loader_.load(path);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::ParseFailure);
    EXPECT_NE(result.message().find("broken.sav"), std::string::npos);
    EXPECT_NE(result.message().find("Line "), std::string::npos);
}
