#include "transfer/compression.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <zlib.h>

namespace {

const size_t kBufferSize = 256 * 1024;
// 15 bits of window plus 16 selects the gzip wrapper.
const int kGzipWindowBits = 15 + 16;

std::string zlibMessage(const z_stream& stream, int code) {
    if (stream.msg) {
        return stream.msg;
    }
    const char* text = zError(code);
    return text ? text : "unknown zlib error";
}

} // namespace

GzipSink::GzipSink(ByteSink& inner, int level)
    : inner_(inner)
    , stream_(std::make_unique<z_stream>())
    , out_(kBufferSize) {
    if (level < Z_BEST_SPEED || level > Z_BEST_COMPRESSION) {
        throw TransferError(ErrorKind::InvalidJob,
                            "Compression level must be between 1 and 9, got " + std::to_string(level));
    }

    std::memset(stream_.get(), 0, sizeof(z_stream));
    int ret = deflateInit2(stream_.get(), level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        stream_.reset();
        throw TransferError(ErrorKind::SinkWrite, "Failed to initialize gzip encoder: " + std::string(zError(ret)));
    }
}

GzipSink::~GzipSink() {
    if (stream_) {
        deflateEnd(stream_.get());
    }
}

void GzipSink::write(const uint8_t* data, size_t size) {
    if (finished_) {
        throw TransferError(ErrorKind::SinkWrite, "Write after gzip stream was finished");
    }

    // avail_in is 32-bit; feed very large writes in slices.
    while (size > 0) {
        size_t slice = std::min<size_t>(size, 1u << 30);
        stream_->next_in = const_cast<Bytef*>(data);
        stream_->avail_in = static_cast<uInt>(slice);
        drain(Z_NO_FLUSH);
        data += slice;
        size -= slice;
    }
}

void GzipSink::flush() {
    inner_.flush();
}

void GzipSink::finish() {
    if (finished_) {
        return;
    }
    stream_->next_in = nullptr;
    stream_->avail_in = 0;
    drain(Z_FINISH);
    finished_ = true;
}

void GzipSink::drain(int flushMode) {
    for (;;) {
        stream_->next_out = out_.data();
        stream_->avail_out = static_cast<uInt>(out_.size());

        int ret = deflate(stream_.get(), flushMode);
        if (ret == Z_STREAM_ERROR) {
            throw TransferError(ErrorKind::SinkWrite, "gzip encoder failed: " + zlibMessage(*stream_, ret));
        }

        size_t produced = out_.size() - stream_->avail_out;
        if (produced > 0) {
            inner_.write(out_.data(), produced);
        }

        if (flushMode == Z_FINISH) {
            if (ret == Z_STREAM_END) {
                return;
            }
        } else if (stream_->avail_out != 0) {
            return;
        }
    }
}

GzipSource::GzipSource(ByteSource& inner)
    : inner_(inner)
    , stream_(std::make_unique<z_stream>())
    , in_(kBufferSize)
    , memberEnded_(true) {
    std::memset(stream_.get(), 0, sizeof(z_stream));
    int ret = inflateInit2(stream_.get(), kGzipWindowBits);
    if (ret != Z_OK) {
        stream_.reset();
        throw TransferError(ErrorKind::SourceRead, "Failed to initialize gzip decoder: " + std::string(zError(ret)));
    }
}

GzipSource::~GzipSource() {
    if (stream_) {
        inflateEnd(stream_.get());
    }
}

void GzipSource::refill() {
    size_t n = inner_.read(in_.data(), in_.size());
    if (n == 0) {
        innerEof_ = true;
        return;
    }
    stream_->next_in = in_.data();
    stream_->avail_in = static_cast<uInt>(n);
}

size_t GzipSource::read(uint8_t* buffer, size_t size) {
    if (done_ || size == 0) {
        return 0;
    }

    stream_->next_out = buffer;
    stream_->avail_out = static_cast<uInt>(std::min<size_t>(size, 1u << 30));
    uInt requested = stream_->avail_out;

    while (stream_->avail_out > 0) {
        if (stream_->avail_in == 0 && !innerEof_) {
            refill();
        }

        if (memberEnded_) {
            if (stream_->avail_in == 0) {
                done_ = true;
                break;
            }
            inflateReset(stream_.get());
            memberEnded_ = false;
        }

        if (stream_->avail_in == 0) {
            throw TransferError(ErrorKind::SourceRead, "Compressed image is truncated");
        }

        int ret = inflate(stream_.get(), Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            memberEnded_ = true;
        } else if (ret == Z_BUF_ERROR && stream_->avail_in == 0) {
            continue;
        } else if (ret != Z_OK) {
            throw TransferError(ErrorKind::SourceRead, "Compressed image is corrupt: " + zlibMessage(*stream_, ret));
        }
    }

    return requested - stream_->avail_out;
}

bool isCompressedImagePath(const std::string& path) {
    if (path.size() < 3) {
        return false;
    }
    std::string suffix = path.substr(path.size() - 3);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return suffix == ".gz";
}
