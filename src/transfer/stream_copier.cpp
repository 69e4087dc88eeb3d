#include "transfer/stream_copier.hpp"
#include "common/logger.hpp"
#include "transfer/rate_estimator.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <thread>

StreamCopier::StreamCopier(size_t chunkSize, size_t queueCapacity,
                           std::chrono::milliseconds progressInterval)
    : chunkSize_(chunkSize)
    , progressInterval_(progressInterval)
    , queue_(queueCapacity) {
    if (chunkSize_ == 0) {
        throw TransferError(ErrorKind::InvalidJob, "Chunk size must be positive");
    }
}

CopyResult StreamCopier::run(ByteSource& source, ByteSink& sink, uint64_t totalBytes,
                             const CancellationToken& token, DigestAccumulator* digest,
                             const ProgressCallback& progress) {
    std::thread producer([&] { produce(source, totalBytes, token); });
    std::thread consumer([&] { consume(sink, totalBytes, token, digest, progress); });
    producer.join();
    consumer.join();

    CopyResult result;
    result.bytesCopied = bytesWritten_;
    result.peakQueuedChunks = queue_.highWaterMark();
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        result.error = error_;
        result.errorMessage = errorMessage_;
    }
    result.cancelled = result.error == ErrorKind::None && bytesWritten_ < totalBytes && token.isCancelled();
    return result;
}

void StreamCopier::produce(ByteSource& source, uint64_t totalBytes, const CancellationToken& token) {
    uint64_t offset = 0;
    try {
        while (offset < totalBytes) {
            if (token.isCancelled()) {
                queue_.abort();
                return;
            }

            size_t want = static_cast<size_t>(std::min<uint64_t>(chunkSize_, totalBytes - offset));
            Chunk chunk(want);
            size_t got = readFully(source, chunk.data(), want);
            if (got < want) {
                throw TransferError(ErrorKind::SourceRead,
                                    "Unexpected end of source at byte " + std::to_string(offset + got) +
                                    " of " + std::to_string(totalBytes));
            }
            offset += got;

            if (!queue_.push(std::move(chunk))) {
                // Aborted by the writer or by cancellation.
                return;
            }
        }
        queue_.close();
    } catch (const TransferError& e) {
        recordError(e.kind(), e.what());
    } catch (const std::exception& e) {
        recordError(ErrorKind::SourceRead, e.what());
    }
}

void StreamCopier::consume(ByteSink& sink, uint64_t totalBytes, const CancellationToken& token,
                           DigestAccumulator* digest, const ProgressCallback& progress) {
    RateEstimator estimator(totalBytes, progressInterval_);
    try {
        Chunk chunk;
        while (queue_.pop(chunk)) {
            if (token.isCancelled()) {
                queue_.abort();
                return;
            }

            if (digest) {
                digest->update(chunk.data(), chunk.size());
            }
            sink.write(chunk.data(), chunk.size());
            bytesWritten_ += chunk.size();

            if (progress && (progressInterval_.count() == 0 || estimator.due())) {
                progress(estimator.sample(bytesWritten_));
            }
        }

        if (queue_.isAborted()) {
            return;
        }
        if (progress) {
            progress(estimator.sample(bytesWritten_));
        }
    } catch (const TransferError& e) {
        recordError(e.kind(), e.what());
    } catch (const std::exception& e) {
        recordError(ErrorKind::SinkWrite, e.what());
    }
}

void StreamCopier::recordError(ErrorKind kind, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        // The first failure is the cause; later ones are fallout of the abort.
        if (error_ == ErrorKind::None) {
            error_ = kind;
            errorMessage_ = message;
        }
    }
    Logger::error(message);
    queue_.abort();
}
