#include "transfer/atomic_sink.hpp"
#include "common/logger.hpp"
#include "transfer/transfer_error.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace {

void syncDirectoryOf(const std::string& path) {
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        Logger::warning("Cannot open directory " + dir.string() + " for sync: " + std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        Logger::warning("fsync of directory " + dir.string() + " failed: " + std::strerror(errno));
    }
    ::close(fd);
}

} // namespace

AtomicFileSink::AtomicFileSink(const std::string& destinationPath)
    : destinationPath_(destinationPath)
    , temporaryPath_(temporaryPathFor(destinationPath)) {
    if (destinationPath_.empty()) {
        throw TransferError(ErrorKind::InvalidJob, "Destination path is empty");
    }

    if (::unlink(temporaryPath_.c_str()) == 0) {
        Logger::info("Removed stale temporary file " + temporaryPath_);
    } else if (errno != ENOENT) {
        throw TransferError::fromErrno(ErrorKind::SinkWrite, "Cannot remove stale " + temporaryPath_, errno);
    }

    int fd = ::open(temporaryPath_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw TransferError::fromErrno(ErrorKind::SinkWrite, "Cannot create " + temporaryPath_, errno);
    }
    file_ = std::make_unique<FileSink>(fd, temporaryPath_);
    Logger::debug("Writing image to temporary file " + temporaryPath_);
}

AtomicFileSink::~AtomicFileSink() {
    if (!committed_) {
        discard();
    }
}

std::string AtomicFileSink::temporaryPathFor(const std::string& destinationPath) {
    return destinationPath + ".partial";
}

void AtomicFileSink::write(const uint8_t* data, size_t size) {
    if (committed_ || !file_) {
        throw TransferError(ErrorKind::SinkWrite, "Write to finished image " + destinationPath_);
    }
    file_->write(data, size);
    bytesWritten_ += size;
}

void AtomicFileSink::flush() {
    if (file_) {
        file_->flush();
    }
}

void AtomicFileSink::commit() {
    if (committed_) {
        return;
    }
    if (!file_) {
        throw TransferError(ErrorKind::SinkWrite, "Image " + destinationPath_ + " was already discarded");
    }

    file_->close();

    if (std::rename(temporaryPath_.c_str(), destinationPath_.c_str()) != 0) {
        throw TransferError::fromErrno(ErrorKind::SinkWrite,
                                       "Cannot rename " + temporaryPath_ + " to " + destinationPath_, errno);
    }
    committed_ = true;
    file_.reset();
    syncDirectoryOf(destinationPath_);
    Logger::info("Committed image " + destinationPath_);
}

void AtomicFileSink::discard() {
    if (committed_) {
        return;
    }
    file_.reset();
    if (::unlink(temporaryPath_.c_str()) == 0) {
        Logger::info("Rolled back temporary file " + temporaryPath_);
    } else if (errno != ENOENT) {
        Logger::error("Failed to remove temporary file " + temporaryPath_ + ": " + std::strerror(errno));
    }
}
