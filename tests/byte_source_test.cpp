#include <cstdio>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <recordflow/byte_source.hpp>
#include <recordflow/record_writer.hpp>

#include "test_files.hpp"

using namespace recordflow;

namespace {

std::vector<std::string> read_lines(ByteSource& src) {
    std::vector<std::string> lines;
    std::string line;
    while (src.read_line(&line))
        lines.push_back(line);
    return lines;
}

std::string read_all(ByteSource& src) {
    std::string all;
    std::string chunk;
    while (src.read_chunk(7, &chunk))
        all += chunk;
    return all;
}

std::string sample_text(int lines) {
    std::string s;
    for (int i = 0; i < lines; ++i)
        s += "line number " + std::to_string(i) + " of the sample\n";
    return s;
}

} // namespace

TEST(ByteSourceTest, ParsesCompressionNames) {
    EXPECT_EQ(parse_compression_type(""), CompressionType::None);
    EXPECT_EQ(parse_compression_type("GZIP"), CompressionType::Gzip);
    EXPECT_EQ(parse_compression_type("ZLIB"), CompressionType::Zlib);
    EXPECT_THROW(parse_compression_type("gzip"), InvalidArgumentError);
    EXPECT_THROW(parse_compression_type("LZ4"), InvalidArgumentError);
    if (zstd_available())
        EXPECT_EQ(parse_compression_type("ZSTD"), CompressionType::Zstd);
    else
        EXPECT_THROW(parse_compression_type("ZSTD"), InvalidArgumentError);
    EXPECT_STREQ(compression_type_name(CompressionType::Gzip), "GZIP");
    EXPECT_STREQ(compression_type_name(CompressionType::None), "");
}

TEST(ByteSourceTest, MissingFileIsNotFound) {
    EXPECT_THROW(ByteSource::open("bs_does_not_exist.txt"), NotFoundError);
    std::filesystem::create_directory("bs_dir");
    EXPECT_THROW(ByteSource::open("bs_dir"), NotFoundError);
    std::filesystem::remove("bs_dir");
}

TEST(ByteSourceTest, RejectsNonPositiveBufferSize) {
    write_file("bs_buf.txt", "abc\n");
    EXPECT_THROW(ByteSource::open("bs_buf.txt", CompressionType::None, 0), InvalidArgumentError);
    EXPECT_THROW(checked_buffer_size(0), InvalidArgumentError);
    EXPECT_THROW(checked_buffer_size(-5), InvalidArgumentError);
    EXPECT_EQ(checked_buffer_size(10), 10u);
    std::remove("bs_buf.txt");
}

TEST(ByteSourceTest, ReadsLinesWithEitherTerminator) {
    write_file("bs_lines.txt", "a\r\nb\n\nc\rd\r\nlast");
    for (std::size_t buf : {std::size_t{1}, std::size_t{3}, std::size_t{1024}}) {
        auto src = ByteSource::open("bs_lines.txt", CompressionType::None, buf);
        auto lines = read_lines(*src);
        ASSERT_EQ(lines.size(), 5u) << "buffer " << buf;
        EXPECT_EQ(lines[0], "a");
        EXPECT_EQ(lines[1], "b");
        EXPECT_EQ(lines[2], "");
        EXPECT_EQ(lines[3], "c\rd");
        EXPECT_EQ(lines[4], "last");
    }
    std::remove("bs_lines.txt");
}

TEST(ByteSourceTest, EmptyFileHasNoLines) {
    write_file("bs_empty.txt", "");
    auto src = ByteSource::open("bs_empty.txt");
    std::string line;
    EXPECT_FALSE(src->read_line(&line));
    EXPECT_FALSE(src->read_line(&line));
    std::remove("bs_empty.txt");
}

TEST(ByteSourceTest, ReadExactSkipAndOffset) {
    write_file("bs_exact.bin", "0123456789");
    auto src = ByteSource::open("bs_exact.bin", CompressionType::None, 4);
    EXPECT_EQ(src->skip(3), 3u);
    std::string out;
    EXPECT_EQ(src->read_exact(5, &out), 5u);
    EXPECT_EQ(out, "34567");
    EXPECT_EQ(src->offset(), 8u);
    EXPECT_EQ(src->read_exact(5, &out), 2u);
    EXPECT_EQ(out, "89");
    EXPECT_EQ(src->read_exact(5, &out), 0u);
    EXPECT_EQ(src->skip(4), 0u);
    EXPECT_EQ(src->offset(), 10u);
    std::remove("bs_exact.bin");
}

TEST(ByteSourceTest, InflatesGzipAndZlib) {
    std::string text = sample_text(200);
    write_gzip_file("bs_text.gz", text);
    write_zlib_file("bs_text.z", text);
    for (std::size_t buf : {std::size_t{10}, std::size_t{1 << 20}}) {
        auto gz = ByteSource::open("bs_text.gz", CompressionType::Gzip, buf);
        EXPECT_EQ(read_all(*gz), text);
        auto z = ByteSource::open("bs_text.z", CompressionType::Zlib, buf);
        EXPECT_EQ(read_all(*z), text);
    }
    std::remove("bs_text.gz");
    std::remove("bs_text.z");
}

TEST(ByteSourceTest, DecodesConcatenatedGzipMembers) {
    write_gzip_file("bs_part1.gz", "first\n");
    write_gzip_file("bs_part2.gz", "second\nthird");
    write_file("bs_joined.gz", read_file("bs_part1.gz") + read_file("bs_part2.gz"));
    auto src = ByteSource::open("bs_joined.gz", CompressionType::Gzip, 5);
    auto lines = read_lines(*src);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "third");
    remove_files({"bs_part1.gz", "bs_part2.gz", "bs_joined.gz"});
}

TEST(ByteSourceTest, TruncatedGzipIsDataLoss) {
    write_gzip_file("bs_full.gz", sample_text(500));
    std::string bytes = read_file("bs_full.gz");
    write_file("bs_trunc.gz", bytes.substr(0, bytes.size() / 2));
    auto src = ByteSource::open("bs_trunc.gz", CompressionType::Gzip, 64);
    EXPECT_THROW(read_lines(*src), DataLossError);
    remove_files({"bs_full.gz", "bs_trunc.gz"});
}

TEST(ByteSourceTest, GarbageIsDataLoss) {
    write_file("bs_garbage.gz", "this is not a compressed stream at all\n");
    auto gz = ByteSource::open("bs_garbage.gz", CompressionType::Gzip);
    EXPECT_THROW(read_lines(*gz), DataLossError);
    auto z = ByteSource::open("bs_garbage.gz", CompressionType::Zlib);
    EXPECT_THROW(read_lines(*z), DataLossError);
    std::remove("bs_garbage.gz");
}

TEST(ByteSourceTest, ZstdRoundTrip) {
    if (!zstd_available())
        GTEST_SKIP() << "built without zstd";
    std::string text = sample_text(100);
    {
        auto out = open_output_stream("bs_text.zst", CompressionType::Zstd);
        out->write(text.data(), text.size());
        out->close();
    }
    auto src = ByteSource::open("bs_text.zst", CompressionType::Zstd, 16);
    EXPECT_EQ(read_all(*src), text);

    std::string bytes = read_file("bs_text.zst");
    write_file("bs_trunc.zst", bytes.substr(0, bytes.size() - 4));
    auto trunc = ByteSource::open("bs_trunc.zst", CompressionType::Zstd, 16);
    EXPECT_THROW(read_all(*trunc), DataLossError);
    remove_files({"bs_text.zst", "bs_trunc.zst"});
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
