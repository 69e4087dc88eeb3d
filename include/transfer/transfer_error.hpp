#pragma once

#include "common/transfer_status.hpp"
#include <stdexcept>
#include <string>

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // Builds an error from an errno value. Out-of-space and vanished-media
    // errors override defaultKind.
    static TransferError fromErrno(ErrorKind defaultKind, const std::string& context, int err);

private:
    ErrorKind kind_;
};
