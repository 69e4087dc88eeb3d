#pragma once

#include "transfer/stream.hpp"
#include <memory>
#include <string>
#include <vector>

typedef struct z_stream_s z_stream;

// Gzip-compresses every write before it reaches the inner sink.
// finish() writes the trailer; destroying an unfinished sink discards the
// deflate state without producing a valid container.
class GzipSink : public ByteSink {
public:
    GzipSink(ByteSink& inner, int level);
    ~GzipSink() override;

    GzipSink(const GzipSink&) = delete;
    GzipSink& operator=(const GzipSink&) = delete;

    void write(const uint8_t* data, size_t size) override;
    // Flushes the inner sink only; the deflate stream stays open.
    void flush() override;
    void finish();

    bool isFinished() const { return finished_; }

private:
    void drain(int flushMode);

    ByteSink& inner_;
    std::unique_ptr<z_stream> stream_;
    std::vector<uint8_t> out_;
    bool finished_{false};
};

// Inflates a gzip stream read from the inner source. Concatenated members
// are read back to back.
class GzipSource : public ByteSource {
public:
    explicit GzipSource(ByteSource& inner);
    ~GzipSource() override;

    GzipSource(const GzipSource&) = delete;
    GzipSource& operator=(const GzipSource&) = delete;

    size_t read(uint8_t* buffer, size_t size) override;

private:
    void refill();

    ByteSource& inner_;
    std::unique_ptr<z_stream> stream_;
    std::vector<uint8_t> in_;
    bool innerEof_{false};
    bool memberEnded_{false};
    bool done_{false};
};

// Restore reads an image through GzipSource when the name ends in ".gz".
bool isCompressedImagePath(const std::string& path);
