#include <cstdio>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <recordflow/record_readers.hpp>
#include <recordflow/record_writer.hpp>

#include "test_files.hpp"

using namespace recordflow;

namespace {

std::vector<std::string> read_records(RecordReader& reader) {
    std::vector<std::string> out;
    std::string rec;
    while (reader.read_record(&rec))
        out.push_back(rec);
    return out;
}

ReadOptions options(CompressionType c = CompressionType::None, std::size_t buffer = 1024) {
    ReadOptions r;
    r.compression = c;
    r.buffer_size = buffer;
    return r;
}

} // namespace

TEST(TextLineReaderTest, ReadsEveryLine) {
    auto files = create_text_files("rr", 2, 5, true);
    TextLineFormat format(options(CompressionType::None, 3));
    for (int i = 0; i < 2; ++i) {
        auto reader = format.open(files[i]);
        auto lines = read_records(*reader);
        ASSERT_EQ(lines.size(), 5u);
        for (int j = 0; j < 5; ++j)
            EXPECT_EQ(lines[j], text_line(i, j));
    }
    remove_files(files);
}

TEST(FixedLengthReaderTest, RejectsBadOptions) {
    EXPECT_THROW(make_fixed_length_options(0, 0, 0), InvalidArgumentError);
    EXPECT_THROW(make_fixed_length_options(-3, 0, 0), InvalidArgumentError);
    EXPECT_THROW(make_fixed_length_options(3, -1, 0), InvalidArgumentError);
    EXPECT_THROW(make_fixed_length_options(3, 0, -1), InvalidArgumentError);
    auto opts = make_fixed_length_options(3, 5, 2);
    EXPECT_EQ(opts.record_bytes, 3u);
    EXPECT_EQ(opts.header_bytes, 5u);
    EXPECT_EQ(opts.footer_bytes, 2u);
}

TEST(FixedLengthReaderTest, SkipsHeaderAndFooter) {
    auto files = create_fixed_length_files("rr", 2, 7, 3, 5, 2);
    for (std::size_t buf : {std::size_t{1}, std::size_t{4}, std::size_t{4096}}) {
        FixedLengthFormat format(options(CompressionType::None, buf),
                                 make_fixed_length_options(3, 5, 2));
        for (int i = 0; i < 2; ++i) {
            format.validate(files[i]);
            auto reader = format.open(files[i]);
            auto recs = read_records(*reader);
            ASSERT_EQ(recs.size(), 7u);
            for (int j = 0; j < 7; ++j)
                EXPECT_EQ(recs[j], fixed_record(i, j, 3));
        }
    }
    remove_files(files);
}

TEST(FixedLengthReaderTest, FooterLongerThanRecord) {
    write_file("rr_longfoot.bin", "H" "abcdef" + std::string(8, 'F'));
    FixedLengthFormat format(options(CompressionType::None, 2), make_fixed_length_options(2, 1, 8));
    auto reader = format.open("rr_longfoot.bin");
    auto recs = read_records(*reader);
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0], "ab");
    EXPECT_EQ(recs[2], "ef");
    std::remove("rr_longfoot.bin");
}

TEST(FixedLengthReaderTest, UncompressedSizeCheckedUpFront) {
    write_file("rr_badsize.bin", "HHHHH" "000111222" "3" "FF");
    FixedLengthFormat format(options(), make_fixed_length_options(3, 5, 2));
    EXPECT_THROW(format.validate("rr_badsize.bin"), InvalidArgumentError);
    EXPECT_THROW(format.validate("rr_missing.bin"), NotFoundError);

    write_file("rr_short.bin", "HHH");
    EXPECT_THROW(format.validate("rr_short.bin"), InvalidArgumentError);
    remove_files({"rr_badsize.bin", "rr_short.bin"});
}

TEST(FixedLengthReaderTest, CompressedSizeCheckedWhileReading) {
    write_gzip_file("rr_badsize.gz", "HHHHH" "000111222" "3" "FF");
    FixedLengthFormat format(options(CompressionType::Gzip), make_fixed_length_options(3, 5, 2));
    format.validate("rr_badsize.gz");
    auto reader = format.open("rr_badsize.gz");
    std::string rec;
    ASSERT_TRUE(reader->read_record(&rec));
    EXPECT_EQ(rec, "000");
    ASSERT_TRUE(reader->read_record(&rec));
    ASSERT_TRUE(reader->read_record(&rec));
    EXPECT_EQ(rec, "222");
    EXPECT_THROW(reader->read_record(&rec), InvalidArgumentError);
    std::remove("rr_badsize.gz");
}

TEST(FramedReaderTest, ReadsWrittenRecords) {
    std::vector<std::string> records{"", "a", std::string(70000, 'x'), "last"};
    write_framed_file("rr_plain.rec", records);
    // 4 frames of 16 bytes overhead each.
    EXPECT_EQ(read_file("rr_plain.rec").size(), 16u * 4 + 1 + 70000 + 4);
    for (std::size_t buf : {std::size_t{1}, std::size_t{10}, std::size_t{1 << 20}}) {
        FramedFormat format(options(CompressionType::None, buf));
        auto reader = format.open("rr_plain.rec");
        EXPECT_EQ(read_records(*reader), records);
    }
    std::remove("rr_plain.rec");
}

TEST(FramedReaderTest, ReadsCompressedFiles) {
    std::vector<std::string> records{"one", "two", "three"};
    write_framed_file("rr_comp.rec.gz", records, CompressionType::Gzip);
    write_framed_file("rr_comp.rec.z", records, CompressionType::Zlib);
    FramedFormat gz(options(CompressionType::Gzip, 5));
    auto r1 = gz.open("rr_comp.rec.gz");
    EXPECT_EQ(read_records(*r1), records);
    FramedFormat z(options(CompressionType::Zlib, 5));
    auto r2 = z.open("rr_comp.rec.z");
    EXPECT_EQ(read_records(*r2), records);
    remove_files({"rr_comp.rec.gz", "rr_comp.rec.z"});

    if (zstd_available()) {
        write_framed_file("rr_comp.rec.zst", records, CompressionType::Zstd);
        FramedFormat zs(options(CompressionType::Zstd, 5));
        auto r3 = zs.open("rr_comp.rec.zst");
        EXPECT_EQ(read_records(*r3), records);
        std::remove("rr_comp.rec.zst");
    }
}

TEST(FramedReaderTest, CorruptLengthIsDataLoss) {
    std::string frame = encode_framed_record("payload");
    frame[0] ^= 0x01;
    write_file("rr_badlen.rec", encode_framed_record("good") + frame);
    FramedFormat format(options());
    auto reader = format.open("rr_badlen.rec");
    std::string rec;
    ASSERT_TRUE(reader->read_record(&rec));
    EXPECT_EQ(rec, "good");
    try {
        reader->read_record(&rec);
        FAIL() << "expected DataLossError";
    } catch (const DataLossError& e) {
        EXPECT_NE(std::string(e.what()).find("offset 20"), std::string::npos) << e.what();
    }
    // The reader does not try to resynchronise.
    EXPECT_THROW(reader->read_record(&rec), DataLossError);
    std::remove("rr_badlen.rec");
}

TEST(FramedReaderTest, CorruptPayloadIsDataLoss) {
    std::string frame = encode_framed_record("payload");
    frame[13] ^= 0x20;
    write_file("rr_baddata.rec", frame);
    FramedFormat format(options());
    auto reader = format.open("rr_baddata.rec");
    std::string rec;
    EXPECT_THROW(reader->read_record(&rec), DataLossError);
    std::remove("rr_baddata.rec");
}

TEST(FramedReaderTest, TruncationIsDataLoss) {
    std::string good = encode_framed_record("complete");
    std::string frame = encode_framed_record("incomplete");
    FramedFormat format(options());
    std::string rec;

    write_file("rr_trunc.rec", good + frame.substr(0, frame.size() - 3));
    auto r1 = format.open("rr_trunc.rec");
    ASSERT_TRUE(r1->read_record(&rec));
    EXPECT_THROW(r1->read_record(&rec), DataLossError);

    write_file("rr_trunc.rec", good + frame.substr(0, 5));
    auto r2 = format.open("rr_trunc.rec");
    ASSERT_TRUE(r2->read_record(&rec));
    EXPECT_THROW(r2->read_record(&rec), DataLossError);

    write_file("rr_trunc.rec", good);
    auto r3 = format.open("rr_trunc.rec");
    ASSERT_TRUE(r3->read_record(&rec));
    EXPECT_FALSE(r3->read_record(&rec));
    std::remove("rr_trunc.rec");
}

TEST(FramedReaderTest, OversizedLengthIsDataLoss) {
    write_file("rr_big.rec", encode_framed_record("twelve bytes"));
    FramedRecordReader reader(ByteSource::open("rr_big.rec"), 8);
    std::string rec;
    EXPECT_THROW(reader.read_record(&rec), DataLossError);
    std::remove("rr_big.rec");
}

TEST(FramedWriterTest, ClosedWriterRejectsWrites) {
    FramedRecordWriter writer("rr_closed.rec");
    writer.write("a");
    writer.write("b");
    EXPECT_EQ(writer.records_written(), 2u);
    writer.close();
    writer.close();
    EXPECT_THROW(writer.write("c"), FailedPreconditionError);
    std::remove("rr_closed.rec");
}

TEST(FramedWriterTest, UnwritablePathIsNotFound) {
    EXPECT_THROW(FramedRecordWriter("rr_no_such_dir/out.rec"), NotFoundError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
