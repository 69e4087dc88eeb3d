#include "cli/transfer_cli.hpp"
#include "backup/image_verifier.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <signal.h>
#include <sstream>
#include <thread>

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

void handleInterrupt(int) {
    interruptRequested = 1;
}

std::mutex outputMutex;

bool parseSize(const std::string& text, size_t& value) {
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(text, &pos);
        if (pos != text.size() || text[0] == '-') {
            return false;
        }
        value = static_cast<size_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

TransferCLI::TransferCLI(std::shared_ptr<TransferPipeline> pipeline)
    : pipeline_(std::move(pipeline)) {
}

TransferCLI::~TransferCLI() {
}

void TransferCLI::installSignalHandlers() {
    struct sigaction action = {};
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void TransferCLI::printUsage() const {
    std::cout << "Usage: diskimager <command> [options]\n"
              << "Commands:\n"
              << "  list                                   List removable devices\n"
              << "  backup  --device PATH --output IMAGE   Copy a device into an image file\n"
              << "  restore --image IMAGE --device PATH    Write an image back to a device\n"
              << "  clone   --source PATH --target PATH    Copy one device onto another\n"
              << "  verify  --image IMAGE                  Check an image against its digest\n"
              << "\n"
              << "Options:\n"
              << "  --hash ALGO          sha256 (default), md5 or none\n"
              << "  --compress           Gzip the image (backup)\n"
              << "  --level N            Compression level 1-9 (default 1)\n"
              << "  --no-verify          Skip digest verification after restore\n"
              << "  --chunk-size BYTES   Transfer chunk size (default 8388608)\n"
              << "  --queue-depth N      Chunks buffered between reader and writer (default 16)\n"
              << "  --config FILE        Load settings from a JSON file\n"
              << "  --log-file PATH      Log file (default /tmp/diskimager.log)\n"
              << "  --log-level LEVEL    debug, info, warning, error\n"
              << "  -y, --yes            Do not ask before overwriting a device\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version information\n";
}

int TransferCLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return EXIT_FAILED;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage();
        return EXIT_COMPLETED;
    }
    if (command == "--version") {
        std::cout << "diskimager version 1.0.0\n";
        return EXIT_COMPLETED;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    Options options;
    std::string error;
    if (!parseOptions(args, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printUsage();
        return EXIT_FAILED;
    }
    if (options.help) {
        printUsage();
        return EXIT_COMPLETED;
    }

    setupLogging(options.settings);
    Logger::info("Command: " + command);

    if (command == "list") {
        return handleListCommand();
    } else if (command == "backup") {
        return handleBackupCommand(options);
    } else if (command == "restore") {
        return handleRestoreCommand(options);
    } else if (command == "clone") {
        return handleCloneCommand(options);
    } else if (command == "verify") {
        return handleVerifyCommand(options);
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    Logger::error("Unknown command: " + command);
    printUsage();
    return EXIT_FAILED;
}

bool TransferCLI::parseOptions(const std::vector<std::string>& args, Options& options, std::string& error) const {
    // The config file is the base layer; every other option overrides it.
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config requires a file";
                return false;
            }
            options.configPath = args[i + 1];
            if (!loadSettingsFile(options.configPath, options.settings, error)) {
                return false;
            }
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string text;
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-y" || arg == "--yes") {
            options.assumeYes = true;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--device" || arg == "--source") {
            if (!value(options.device)) return false;
        } else if (arg == "--target") {
            if (!value(options.target)) return false;
        } else if (arg == "--output" || arg == "--image") {
            if (!value(options.image)) return false;
        } else if (arg == "--hash") {
            if (!value(text)) return false;
            if (!parseDigestAlgorithm(text, options.settings.digest)) {
                error = "Unknown digest algorithm: " + text;
                return false;
            }
        } else if (arg == "--compress") {
            options.settings.compress = true;
        } else if (arg == "--level") {
            if (!value(text)) return false;
            size_t level = 0;
            if (!parseSize(text, level) || level > 9) {
                error = "Invalid compression level: " + text;
                return false;
            }
            options.settings.compressionLevel = static_cast<int>(level);
        } else if (arg == "--no-verify") {
            options.settings.verifyAfterRestore = false;
        } else if (arg == "--chunk-size") {
            if (!value(text)) return false;
            if (!parseSize(text, options.settings.chunkSize)) {
                error = "Invalid chunk size: " + text;
                return false;
            }
        } else if (arg == "--queue-depth") {
            if (!value(text)) return false;
            if (!parseSize(text, options.settings.queueCapacity)) {
                error = "Invalid queue depth: " + text;
                return false;
            }
        } else if (arg == "--log-file") {
            if (!value(options.settings.logPath)) return false;
        } else if (arg == "--log-level") {
            if (!value(text)) return false;
            if (!parseLogLevel(text, options.settings.logLevel)) {
                error = "Unknown log level: " + text;
                return false;
            }
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    return validateSettings(options.settings, error);
}

void TransferCLI::setupLogging(const TransferSettings& settings) const {
    if (!Logger::initialize(settings.logPath, settings.logLevel)) {
        std::cerr << "Warning: cannot open log file " << settings.logPath << std::endl;
    }
    // The progress line owns the terminal; problems are printed by the CLI itself.
    Logger::setConsoleOutput(false);
}

bool TransferCLI::resolveDevice(const std::string& path, DeviceDescriptor& device) const {
    auto deviceIo = pipeline_->getDeviceIo();
    if (!deviceIo->describeDevice(path, device)) {
        std::cerr << "Error: " << deviceIo->getLastError() << std::endl;
        Logger::error(deviceIo->getLastError());
        return false;
    }
    return true;
}

bool TransferCLI::confirm(const std::string& question) const {
    std::cout << question << " Type 'yes' to continue: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "yes" || answer == "y";
}

int TransferCLI::handleListCommand() {
    auto devices = pipeline_->getDeviceIo()->enumerateRemovableDevices();
    if (devices.empty()) {
        std::cout << "No removable devices found" << std::endl;
        return EXIT_COMPLETED;
    }

    for (const auto& device : devices) {
        std::cout << std::left << std::setw(14) << device.path
                  << std::right << std::setw(12) << utils::formatBytes(device.sizeBytes)
                  << "  " << device.label << std::endl;
    }
    return EXIT_COMPLETED;
}

int TransferCLI::handleBackupCommand(const Options& options) {
    if (options.device.empty() || options.image.empty()) {
        std::cerr << "Error: backup requires --device and --output" << std::endl;
        return EXIT_FAILED;
    }

    TransferJobConfig config;
    config.direction = Direction::Backup;
    config.imagePath = options.image;
    config.settings = options.settings;
    if (!resolveDevice(options.device, config.device)) {
        return EXIT_FAILED;
    }

    std::cout << "Backing up " << config.device.path << " (" << config.device.label << ", "
              << utils::formatBytes(config.device.sizeBytes) << ") to " << config.imagePath << std::endl;
    return runJob(config);
}

int TransferCLI::handleRestoreCommand(const Options& options) {
    if (options.device.empty() || options.image.empty()) {
        std::cerr << "Error: restore requires --image and --device" << std::endl;
        return EXIT_FAILED;
    }

    TransferJobConfig config;
    config.direction = Direction::Restore;
    config.imagePath = options.image;
    config.settings = options.settings;
    if (!resolveDevice(options.device, config.device)) {
        return EXIT_FAILED;
    }

    if (!options.assumeYes &&
        !confirm("All data on " + config.device.path + " (" + config.device.label + ") will be overwritten.")) {
        std::cout << "Restore aborted" << std::endl;
        return EXIT_CANCELLED;
    }
    return runJob(config);
}

int TransferCLI::handleCloneCommand(const Options& options) {
    if (options.device.empty() || options.target.empty()) {
        std::cerr << "Error: clone requires --source and --target" << std::endl;
        return EXIT_FAILED;
    }

    TransferJobConfig config;
    config.direction = Direction::Clone;
    config.settings = options.settings;
    if (!resolveDevice(options.device, config.device) ||
        !resolveDevice(options.target, config.targetDevice)) {
        return EXIT_FAILED;
    }

    if (!options.assumeYes &&
        !confirm("All data on " + config.targetDevice.path + " (" + config.targetDevice.label +
                 ") will be overwritten.")) {
        std::cout << "Clone aborted" << std::endl;
        return EXIT_CANCELLED;
    }
    return runJob(config);
}

int TransferCLI::handleVerifyCommand(const Options& options) {
    if (options.image.empty()) {
        std::cerr << "Error: verify requires --image" << std::endl;
        return EXIT_FAILED;
    }

    ImageVerifier verifier(options.image);
    if (!verifier.initialize()) {
        std::cerr << "Error: " << verifier.getResult().errorMessage << std::endl;
        return EXIT_FAILED;
    }

    verifier.setProgressCallback([](double fraction) {
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cout << "\rVerifying: " << static_cast<int>(fraction * 100) << "%" << std::flush;
    });

    bool ok = verifier.verify();
    VerificationResult result = verifier.getResult();
    std::cout << std::endl;
    if (!ok) {
        std::cerr << "Verification failed: " << result.errorMessage << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Image OK (" << utils::formatBytes(result.bytesChecked) << ", "
              << result.actualDigest << ")" << std::endl;
    return EXIT_COMPLETED;
}

void TransferCLI::printProgress(const ProgressSample& sample) const {
    double percent = sample.bytesTotal > 0
        ? 100.0 * static_cast<double>(sample.bytesDone) / static_cast<double>(sample.bytesTotal)
        : 100.0;

    std::ostringstream line;
    line << "\r" << std::fixed << std::setprecision(1) << std::setw(5) << percent << "%  "
         << utils::formatBytes(sample.bytesDone) << " / " << utils::formatBytes(sample.bytesTotal) << "  "
         << utils::formatBytes(static_cast<uint64_t>(sample.throughputBytesPerSec)) << "/s  "
         << utils::formatEta(sample.etaSeconds) << "   ";

    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << line.str() << std::flush;
}

int TransferCLI::runJob(const TransferJobConfig& config) {
    pipeline_->setProgressCallback([this](const ProgressSample& sample) { printProgress(sample); });

    auto job = pipeline_->submit(config);
    if (!job) {
        std::cerr << "Error: " << pipeline_->getLastError() << std::endl;
        return EXIT_FAILED;
    }

    interruptRequested = 0;
    bool cancelRequested = false;
    while (!job->isFinished()) {
        if (interruptRequested && !cancelRequested) {
            cancelRequested = true;
            if (pipeline_->cancel()) {
                std::lock_guard<std::mutex> lock(outputMutex);
                std::cout << "\nCancelling..." << std::endl;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    RunOutcome outcome = pipeline_->wait();
    std::cout << std::endl;

    if (outcome.isCompleted()) {
        std::cout << directionToString(config.direction) << " completed: "
                  << utils::formatBytes(outcome.bytesTransferred) << std::endl;
        if (!outcome.digestHex.empty()) {
            std::cout << "Digest: " << outcome.digestHex << std::endl;
        }
        if (!outcome.message.empty()) {
            std::cerr << "Warning: " << outcome.message << std::endl;
        }
        return EXIT_COMPLETED;
    }

    if (outcome.isCancelled()) {
        std::cout << outcome.describe() << std::endl;
        return EXIT_CANCELLED;
    }

    std::cerr << outcome.describe() << std::endl;
    return EXIT_FAILED;
}
