#include "common/errors.hpp"
#include "common/gzip_stream.hpp"
#include "common/tar_stream.hpp"

#include <cstring>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

namespace {

std::string build_archive(const std::vector<std::pair<std::string, std::string>>& files) {
    std::ostringstream out(std::ios::binary);
    gzip::GzipWriter gz(out);
    tar::TarWriter tw(gz);
    for (const auto& f : files) {
        tw.put_entry(f.first, f.second.data(), f.second.size(), 1700000000);
    }
    tw.finish();
    gz.finish();
    return out.str();
}

std::string read_entry(tar::TarReader& tr) {
    std::string data;
    char buf[100];
    size_t n;
    while ((n = tr.read(buf, sizeof(buf))) > 0) data.append(buf, n);
    return data;
}

} // namespace

TEST(TarStreamTest, EntriesComeBackInOrder) {
    std::string blob = build_archive({
        {"a/asset", "hello"},
        {"a/asset.meta", std::string(1000, 'x')},
        {"a/pathname", ""},
    });
    ASSERT_EQ((unsigned char)blob[0], 0x1f);
    ASSERT_EQ((unsigned char)blob[1], 0x8b);

    std::istringstream in(blob, std::ios::binary);
    gzip::GzipReader gz(in);
    tar::TarReader tr(gz);

    tar::TarEntry e;
    ASSERT_TRUE(tr.next_entry(e));
    EXPECT_EQ(e.name, "a/asset");
    EXPECT_EQ(e.size, 5u);
    EXPECT_EQ(e.mtime, 1700000000u);
    EXPECT_EQ(read_entry(tr), "hello");

    // Unread data is skipped
    ASSERT_TRUE(tr.next_entry(e));
    EXPECT_EQ(e.name, "a/asset.meta");
    EXPECT_EQ(e.size, 1000u);

    ASSERT_TRUE(tr.next_entry(e));
    EXPECT_EQ(e.name, "a/pathname");
    EXPECT_EQ(e.size, 0u);

    EXPECT_FALSE(tr.next_entry(e));
    EXPECT_FALSE(tr.next_entry(e));
}

TEST(TarStreamTest, LongNamesSurvive) {
    std::string name = std::string(150, 'n') + "/asset";
    std::string blob = build_archive({{name, "data"}});

    std::istringstream in(blob, std::ios::binary);
    gzip::GzipReader gz(in);
    tar::TarReader tr(gz);

    tar::TarEntry e;
    ASSERT_TRUE(tr.next_entry(e));
    EXPECT_EQ(e.name, name);
    EXPECT_EQ(read_entry(tr), "data");
}

TEST(TarStreamTest, ShortEntryIsRejectedByWriter) {
    std::ostringstream out(std::ios::binary);
    gzip::GzipWriter gz(out);
    tar::TarWriter tw(gz);
    tw.begin_entry("x/asset", 10, 0);
    tw.write_data("abc", 3);
    EXPECT_THROW(tw.end_entry(), ArchiveStreamError);
}

TEST(TarStreamTest, CorruptedChecksumIsRejected) {
    // Build an uncompressed tar, damage the header, then gzip it
    std::ostringstream plain_out(std::ios::binary);
    {
        gzip::GzipWriter gz(plain_out);
        tar::TarWriter tw(gz);
        tw.put_entry("g/asset", "abc", 3, 0);
        tw.finish();
        gz.finish();
    }

    // Decompress, flip a name byte, recompress
    std::string tar_bytes;
    {
        std::istringstream in(plain_out.str(), std::ios::binary);
        gzip::GzipReader gz(in);
        char buf[4096];
        size_t n;
        while ((n = gz.read(buf, sizeof(buf))) > 0) tar_bytes.append(buf, n);
    }
    ASSERT_GE(tar_bytes.size(), tar::TAR_BLOCK_SIZE);
    tar_bytes[0] = 'h';

    std::ostringstream damaged(std::ios::binary);
    {
        gzip::GzipWriter gz(damaged);
        gz.write(tar_bytes.data(), tar_bytes.size());
        gz.finish();
    }

    std::istringstream in(damaged.str(), std::ios::binary);
    gzip::GzipReader gz(in);
    tar::TarReader tr(gz);
    tar::TarEntry e;
    EXPECT_THROW(tr.next_entry(e), ArchiveFormatError);
}

TEST(TarStreamTest, GarbageIsNotAGzipStream) {
    std::istringstream in(std::string("this is not gzip data at all, not even close"),
                          std::ios::binary);
    gzip::GzipReader gz(in);
    tar::TarReader tr(gz);
    tar::TarEntry e;
    EXPECT_THROW(tr.next_entry(e), ArchiveFormatError);
}

TEST(TarStreamTest, NumericFields) {
    char octal[12] = "0000000017";
    EXPECT_EQ(tar::parse_number(octal, sizeof(octal)), 15u);

    char base256[12] = {};
    base256[0]  = (char)0x80;
    base256[11] = 0x05;
    EXPECT_EQ(tar::parse_number(base256, sizeof(base256)), 5u);
}
