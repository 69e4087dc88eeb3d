#include "transfer/transfer_error.hpp"
#include <cerrno>
#include <cstring>

TransferError TransferError::fromErrno(ErrorKind defaultKind, const std::string& context, int err) {
    switch (err) {
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return TransferError(ErrorKind::SinkWrite,
                                 context + ": insufficient destination space (" + std::strerror(err) + ")");
        case ENODEV:
        case ENXIO:
        case ENOMEDIUM:
            return TransferError(ErrorKind::DeviceVanished,
                                 context + ": device disappeared (" + std::strerror(err) + ")");
        case EACCES:
        case EPERM:
            return TransferError(defaultKind, context + ": permission denied");
        case EBUSY:
            return TransferError(defaultKind, context + ": device is in use; unmount its partitions first");
        case EIO:
            return TransferError(defaultKind, context + ": I/O error (bad sectors?)");
        default:
            return TransferError(defaultKind, context + ": " + std::strerror(err));
    }
}
