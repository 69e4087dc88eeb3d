#pragma once

#include <cstdint>
#include <string>

// Identifies one block device (or a file standing in for one). The declared
// size is the number of bytes a backup reads and a restore may write.
struct DeviceDescriptor {
    std::string path;
    uint64_t sizeBytes{0};
    std::string label;
};
