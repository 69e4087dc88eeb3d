#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Readable side of a transfer. read() returns 0 at end of stream and throws
// TransferError on failure.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(uint8_t* buffer, size_t size) = 0;
};

// Writable side of a transfer. write() either stores every byte or throws.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const uint8_t* data, size_t size) = 0;
    // Pushes buffered data down to stable storage.
    virtual void flush() = 0;
};

// Reads until size bytes are collected or the source ends.
size_t readFully(ByteSource& source, uint8_t* buffer, size_t size);

class FileSource : public ByteSource {
public:
    // Takes ownership of fd.
    FileSource(int fd, const std::string& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    static std::unique_ptr<FileSource> open(const std::string& path);

    size_t read(uint8_t* buffer, size_t size) override;
    const std::string& path() const { return path_; }

private:
    int fd_;
    std::string path_;
};

class FileSink : public ByteSink {
public:
    // Takes ownership of fd.
    FileSink(int fd, const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const uint8_t* data, size_t size) override;
    void flush() override;
    // Flushes and closes; errors from close() are reported.
    void close();

    const std::string& path() const { return path_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

private:
    int fd_;
    std::string path_;
    uint64_t bytesWritten_{0};
};
