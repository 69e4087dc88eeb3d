#include <gtest/gtest.h>
#include "transfer/compression.hpp"
#include "transfer/digest_accumulator.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <zlib.h>

namespace {

class VectorSink : public ByteSink {
public:
    void write(const uint8_t* data, size_t size) override { bytes.insert(bytes.end(), data, data + size); }
    void flush() override { flushes++; }

    std::vector<uint8_t> bytes;
    int flushes{0};
};

class VectorSource : public ByteSource {
public:
    explicit VectorSource(std::vector<uint8_t> data, size_t maxRead = SIZE_MAX)
        : data_(std::move(data)), maxRead_(maxRead) {}

    size_t read(uint8_t* buffer, size_t size) override {
        size_t n = std::min({size, maxRead_, data_.size() - offset_});
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        return n;
    }

private:
    std::vector<uint8_t> data_;
    size_t maxRead_;
    size_t offset_{0};
};

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> gzipWithZlib(const std::vector<uint8_t>& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    deflateInit2(&stream, 6, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    std::vector<uint8_t> out(deflateBound(&stream, data.size()) + 64);
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());
    deflate(&stream, Z_FINISH);
    out.resize(out.size() - stream.avail_out);
    deflateEnd(&stream);
    return out;
}

std::vector<uint8_t> readAll(ByteSource& source) {
    std::vector<uint8_t> result;
    std::vector<uint8_t> buffer(4096);
    size_t n;
    while ((n = source.read(buffer.data(), buffer.size())) > 0) {
        result.insert(result.end(), buffer.begin(), buffer.begin() + n);
    }
    return result;
}

} // namespace

TEST(DigestAccumulatorTest, Sha256KnownVector) {
    DigestAccumulator digest(DigestAlgorithm::SHA256);
    auto data = bytesOf("abc");
    digest.update(data.data(), 1);
    digest.update(data.data() + 1, 2);
    EXPECT_EQ(digest.finalizeHex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digest.bytesHashed(), 3u);
    EXPECT_TRUE(digest.isFinalized());
}

TEST(DigestAccumulatorTest, Md5KnownVector) {
    DigestAccumulator digest(DigestAlgorithm::MD5);
    auto data = bytesOf("abc");
    digest.update(data.data(), data.size());
    EXPECT_EQ(digest.finalizeHex(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(DigestAccumulatorTest, FinalizesOnlyOnce) {
    DigestAccumulator digest(DigestAlgorithm::SHA256);
    digest.finalizeHex();
    EXPECT_THROW(digest.finalizeHex(), std::logic_error);
    uint8_t byte = 0;
    EXPECT_THROW(digest.update(&byte, 1), std::logic_error);
}

TEST(DigestAccumulatorTest, NoneIsNoOp) {
    DigestAccumulator digest(DigestAlgorithm::None);
    auto data = bytesOf("ignored");
    digest.update(data.data(), data.size());
    EXPECT_FALSE(digest.isEnabled());
    EXPECT_EQ(digest.bytesHashed(), 0u);
    EXPECT_EQ(digest.finalizeHex(), "");
}

TEST(CompressionTest, GzipSinkProducesValidContainer) {
    std::vector<uint8_t> data(3 * 1024 * 1024);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i % 251);
    }

    VectorSink inner;
    GzipSink sink(inner, 1);
    sink.write(data.data(), data.size() / 2);
    sink.write(data.data() + data.size() / 2, data.size() - data.size() / 2);
    sink.flush();
    sink.finish();
    EXPECT_TRUE(sink.isFinished());
    EXPECT_EQ(inner.flushes, 1);
    EXPECT_LT(inner.bytes.size(), data.size());

    std::vector<uint8_t> restored(data.size() + 1);
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    ASSERT_EQ(inflateInit2(&stream, 15 + 16), Z_OK);
    stream.next_in = inner.bytes.data();
    stream.avail_in = static_cast<uInt>(inner.bytes.size());
    stream.next_out = restored.data();
    stream.avail_out = static_cast<uInt>(restored.size());
    EXPECT_EQ(inflate(&stream, Z_FINISH), Z_STREAM_END);
    restored.resize(restored.size() - stream.avail_out);
    inflateEnd(&stream);
    EXPECT_TRUE(restored == data);
}

TEST(CompressionTest, RejectsInvalidLevel) {
    VectorSink inner;
    EXPECT_THROW(GzipSink(inner, 0), TransferError);
    EXPECT_THROW(GzipSink(inner, 10), TransferError);
}

TEST(CompressionTest, UnfinishedSinkLeavesNoTrailer) {
    VectorSink inner;
    {
        GzipSink sink(inner, 1);
        auto data = bytesOf(std::string(100000, 'x'));
        sink.write(data.data(), data.size());
    }
    VectorSource source(inner.bytes);
    GzipSource gzip(source);
    std::vector<uint8_t> buffer(200000);
    EXPECT_THROW(readFully(gzip, buffer.data(), buffer.size()), TransferError);
}

TEST(CompressionTest, ReadsConcatenatedMembers) {
    auto first = gzipWithZlib(bytesOf("first member, "));
    auto second = gzipWithZlib(bytesOf("second member"));
    std::vector<uint8_t> joined = first;
    joined.insert(joined.end(), second.begin(), second.end());

    // Small inner reads exercise refills in the middle of a member.
    VectorSource source(joined, 7);
    GzipSource gzip(source);
    EXPECT_EQ(readAll(gzip), bytesOf("first member, second member"));
}

TEST(CompressionTest, TruncatedStreamIsReadError) {
    std::vector<uint8_t> data(64 * 1024);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>((i * 13) ^ (i >> 7));
    }
    auto compressed = gzipWithZlib(data);
    compressed.resize(compressed.size() / 2);

    VectorSource source(compressed);
    GzipSource gzip(source);
    try {
        readAll(gzip);
        FAIL() << "truncated stream was accepted";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SourceRead);
    }
}

TEST(CompressionTest, EmptyInputIsEmptyOutput) {
    VectorSource source{std::vector<uint8_t>()};
    GzipSource gzip(source);
    EXPECT_TRUE(readAll(gzip).empty());
}

TEST(CompressionTest, DetectsCompressedImageNames) {
    EXPECT_TRUE(isCompressedImagePath("/backups/stick.img.gz"));
    EXPECT_TRUE(isCompressedImagePath("STICK.GZ"));
    EXPECT_FALSE(isCompressedImagePath("stick.img"));
    EXPECT_FALSE(isCompressedImagePath("gz"));
}
