#include "transfer/stream.hpp"
#include "transfer/transfer_error.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

size_t readFully(ByteSource& source, uint8_t* buffer, size_t size) {
    size_t total = 0;
    while (total < size) {
        size_t n = source.read(buffer + total, size - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

FileSource::FileSource(int fd, const std::string& path)
    : fd_(fd)
    , path_(path) {
}

FileSource::~FileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<FileSource> FileSource::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            throw TransferError(ErrorKind::InvalidJob, "Cannot open " + path + ": no such file");
        }
        throw TransferError::fromErrno(ErrorKind::SourceRead, "Cannot open " + path, err);
    }
    return std::make_unique<FileSource>(fd, path);
}

size_t FileSource::read(uint8_t* buffer, size_t size) {
    for (;;) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw TransferError::fromErrno(ErrorKind::SourceRead, "Read from " + path_ + " failed", errno);
        }
    }
}

FileSink::FileSink(int fd, const std::string& path)
    : fd_(fd)
    , path_(path) {
}

FileSink::~FileSink() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void FileSink::write(const uint8_t* data, size_t size) {
    if (fd_ < 0) {
        throw TransferError(ErrorKind::SinkWrite, "Write to closed file " + path_);
    }

    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError::fromErrno(ErrorKind::SinkWrite, "Write to " + path_ + " failed", errno);
        }
        if (n == 0) {
            throw TransferError(ErrorKind::SinkWrite, "Write to " + path_ + " made no progress");
        }
        written += static_cast<size_t>(n);
        bytesWritten_ += static_cast<uint64_t>(n);
    }
}

void FileSink::flush() {
    if (fd_ < 0) {
        return;
    }
    if (::fsync(fd_) != 0) {
        throw TransferError::fromErrno(ErrorKind::SinkWrite, "Flush of " + path_ + " failed", errno);
    }
}

void FileSink::close() {
    if (fd_ < 0) {
        return;
    }
    flush();
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw TransferError::fromErrno(ErrorKind::SinkWrite, "Close of " + path_ + " failed", errno);
    }
}
