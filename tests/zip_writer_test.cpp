#include "io/zip_writer.h"

#include "zip_reader.h"

#include <gtest/gtest.h>

using pnt::io::ZipWriter;

namespace
{
std::vector<std::uint8_t> Bytes(const std::string& s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
} // namespace

TEST(ZipWriter, WritesReadableEntries)
{
    const std::vector<std::uint8_t> repetitive = Bytes(std::string(4000, 'a') + "tail");
    const std::vector<std::uint8_t> tiny = Bytes("xy");

    ZipWriter zip;
    std::string err;
    ASSERT_TRUE(zip.AddFile("img(1)(1)_blueprint.pnt", repetitive, err)) << err;
    ASSERT_TRUE(zip.AddFile("sub\\dir/./b.pnt", tiny, err)) << err;
    ASSERT_TRUE(zip.AddFile("empty.pnt", {}, err)) << err;
    EXPECT_EQ(zip.EntryCount(), 3u);

    std::vector<std::uint8_t> archive;
    ASSERT_TRUE(zip.Finalize(archive, err)) << err;

    std::vector<pnt::test::ZipEntry> entries;
    ASSERT_TRUE(pnt::test::ReadZip(archive, entries, err)) << err;
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].name, "img(1)(1)_blueprint.pnt");
    EXPECT_EQ(entries[0].method, 8); // compressible
    EXPECT_EQ(entries[0].data, repetitive);
    EXPECT_EQ(entries[0].crc32, lodepng_crc32(repetitive.data(), repetitive.size()));

    EXPECT_EQ(entries[1].name, "sub/dir/b.pnt");
    EXPECT_EQ(entries[1].method, 0); // deflate would not shrink two bytes
    EXPECT_EQ(entries[1].data, tiny);

    EXPECT_EQ(entries[2].name, "empty.pnt");
    EXPECT_TRUE(entries[2].data.empty());
}

TEST(ZipWriter, StoreOnlyWhenCompressionIsZero)
{
    ZipWriter::Options opt;
    opt.compression = 0;
    ZipWriter zip(opt);

    std::string err;
    ASSERT_TRUE(zip.AddFile("a.txt", Bytes(std::string(1000, 'z')), err));
    std::vector<std::uint8_t> archive;
    ASSERT_TRUE(zip.Finalize(archive, err));

    std::vector<pnt::test::ZipEntry> entries;
    ASSERT_TRUE(pnt::test::ReadZip(archive, entries, err)) << err;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].method, 0);
    EXPECT_EQ(entries[0].data.size(), 1000u);
}

TEST(ZipWriter, RejectsTraversalEmptyAndDuplicateNames)
{
    ZipWriter zip;
    std::string err;
    EXPECT_FALSE(zip.AddFile("../evil.pnt", Bytes("x"), err));
    EXPECT_NE(err.find(".."), std::string::npos);
    EXPECT_FALSE(zip.AddFile("a/../../b", Bytes("x"), err));
    EXPECT_FALSE(zip.AddFile("/", Bytes("x"), err));

    ASSERT_TRUE(zip.AddFile("a.pnt", Bytes("x"), err));
    EXPECT_FALSE(zip.AddFile("./a.pnt", Bytes("y"), err));
    EXPECT_NE(err.find("duplicate"), std::string::npos);
    EXPECT_EQ(zip.EntryCount(), 1u);
}

TEST(ZipWriter, FinalizeIsTerminal)
{
    ZipWriter zip;
    std::string err;
    std::vector<std::uint8_t> archive;
    ASSERT_TRUE(zip.Finalize(archive, err));
    // Empty archive: just the end record.
    EXPECT_EQ(archive.size(), 22u);

    EXPECT_FALSE(zip.AddFile("late.pnt", Bytes("x"), err));
    EXPECT_FALSE(zip.Finalize(archive, err));
}

TEST(ZipWriter, DeterministicOutput)
{
    auto build = [] {
        ZipWriter zip;
        std::string err;
        zip.AddFile("one.pnt", Bytes(std::string(300, 'q')), err);
        zip.AddFile("two.pnt", Bytes("0123456789"), err);
        std::vector<std::uint8_t> archive;
        zip.Finalize(archive, err);
        return archive;
    };
    const std::vector<std::uint8_t> a = build();
    EXPECT_FALSE(a.empty());
    EXPECT_EQ(a, build());
}
