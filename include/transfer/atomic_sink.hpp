#pragma once

#include "transfer/stream.hpp"
#include <memory>
#include <string>

// File sink that writes to "<destination>.partial" and only moves the data
// over the destination on commit().
//
// A stale temporary file left by an earlier aborted run is removed when the
// sink is opened. Unless commit() succeeded, destruction (normal scope exit,
// error unwinding or cancellation) closes and removes the temporary file and
// never touches the destination.
class AtomicFileSink : public ByteSink {
public:
    explicit AtomicFileSink(const std::string& destinationPath);
    ~AtomicFileSink() override;

    AtomicFileSink(const AtomicFileSink&) = delete;
    AtomicFileSink& operator=(const AtomicFileSink&) = delete;

    static std::string temporaryPathFor(const std::string& destinationPath);

    void write(const uint8_t* data, size_t size) override;
    void flush() override;

    // fsync, close, rename over the destination, fsync the directory.
    void commit();
    // Explicit rollback; the destructor does the same.
    void discard();

    bool isCommitted() const { return committed_; }
    const std::string& destinationPath() const { return destinationPath_; }
    const std::string& temporaryPath() const { return temporaryPath_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

private:
    std::string destinationPath_;
    std::string temporaryPath_;
    std::unique_ptr<FileSink> file_;
    bool committed_{false};
    uint64_t bytesWritten_{0};
};
