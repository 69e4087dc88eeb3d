#pragma once

#include "common/transfer_config.hpp"
#include "transfer/transfer_pipeline.hpp"
#include <memory>
#include <string>
#include <vector>

// Command line front end: list, backup, restore, clone, verify.
class TransferCLI {
public:
    enum ExitCode {
        EXIT_COMPLETED = 0,
        EXIT_FAILED = 1,
        EXIT_CANCELLED = 2
    };

    explicit TransferCLI(std::shared_ptr<TransferPipeline> pipeline);
    ~TransferCLI();

    // Returns the process exit code.
    int run(int argc, char* argv[]);
    void printUsage() const;

    // Installs the SIGINT handler that requests cancellation.
    static void installSignalHandlers();

private:
    struct Options {
        std::string device;
        std::string target;
        std::string image;
        std::string configPath;
        bool assumeYes{false};
        bool help{false};
        TransferSettings settings;
    };

    bool parseOptions(const std::vector<std::string>& args, Options& options, std::string& error) const;
    bool resolveDevice(const std::string& path, DeviceDescriptor& device) const;
    bool confirm(const std::string& question) const;
    void setupLogging(const TransferSettings& settings) const;

    int handleListCommand();
    int handleBackupCommand(const Options& options);
    int handleRestoreCommand(const Options& options);
    int handleCloneCommand(const Options& options);
    int handleVerifyCommand(const Options& options);

    int runJob(const TransferJobConfig& config);
    void printProgress(const ProgressSample& sample) const;

    std::shared_ptr<TransferPipeline> pipeline_;
};
