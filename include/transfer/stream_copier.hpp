#pragma once

#include "common/cancellation_token.hpp"
#include "common/job.hpp"
#include "common/transfer_status.hpp"
#include "transfer/bounded_queue.hpp"
#include "transfer/digest_accumulator.hpp"
#include "transfer/stream.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct CopyResult {
    uint64_t bytesCopied{0};
    ErrorKind error{ErrorKind::None};
    std::string errorMessage;
    bool cancelled{false};
    size_t peakQueuedChunks{0};

    bool succeeded() const { return error == ErrorKind::None && !cancelled; }
};

// Two-stage copy engine: a reader thread fills fixed-size chunks from the
// source and a writer thread drains them into the sink through a bounded
// queue. Used by backup and clone.
// Chunk memory peaks at (queueCapacity + 2) * chunkSize: the queued chunks,
// one the reader is filling and one the writer is draining.
class StreamCopier {
public:
    StreamCopier(size_t chunkSize, size_t queueCapacity, std::chrono::milliseconds progressInterval);

    StreamCopier(const StreamCopier&) = delete;
    StreamCopier& operator=(const StreamCopier&) = delete;

    // Copies exactly totalBytes. A source that ends early is a read error.
    // digest (optional) sees every chunk right before it is written.
    CopyResult run(ByteSource& source, ByteSink& sink, uint64_t totalBytes,
                   const CancellationToken& token, DigestAccumulator* digest,
                   const ProgressCallback& progress);

    // Wakes both stages; safe from any thread.
    void abort() { queue_.abort(); }

    size_t chunkSize() const { return chunkSize_; }

private:
    using Chunk = std::vector<uint8_t>;

    void produce(ByteSource& source, uint64_t totalBytes, const CancellationToken& token);
    void consume(ByteSink& sink, uint64_t totalBytes, const CancellationToken& token,
                 DigestAccumulator* digest, const ProgressCallback& progress);
    void recordError(ErrorKind kind, const std::string& message);

    size_t chunkSize_;
    std::chrono::milliseconds progressInterval_;
    BoundedQueue<Chunk> queue_;
    uint64_t bytesWritten_{0};

    std::mutex errorMutex_;
    ErrorKind error_{ErrorKind::None};
    std::string errorMessage_;
};
