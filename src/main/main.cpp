#include "cli/transfer_cli.hpp"
#include "common/logger.hpp"
#include "device/device_io.hpp"
#include "transfer/transfer_pipeline.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    TransferCLI::installSignalHandlers();

    int exitCode = TransferCLI::EXIT_FAILED;
    try {
        auto pipeline = std::make_shared<TransferPipeline>(std::make_shared<PosixDeviceIo>());
        TransferCLI cli(pipeline);
        exitCode = cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
    }

    Logger::shutdown();
    return exitCode;
}
