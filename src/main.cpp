#include "rangedl/config.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/download_manager.hpp"
#include "rangedl/errors.hpp"
#include "rangedl/file_descriptor.hpp"
#include "rangedl/logging.hpp"
#include "rangedl/range_transport.hpp"
#include "rangedl/remote_file.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <url1> <file1> [<url2> <file2> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -t <workers>     Connections per file (default: 10)\n"
              << "  -c <KiB>         Chunk size used to track progress (default: 32)\n"
              << "  -r <retries>     Retries per range after a network error (default: 3)\n"
              << "  -b <seconds>     Delay before each retry (default: 10)\n"
              << "  -v               Debug logging\n"
              << "  -q               Only log warnings and errors\n"
              << "  -h, --help       Show this message\n"
              << "Re-running the same command resumes unfinished files." << std::endl;
}

int parseNumber(const std::string& option, const char* value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + std::string(value));
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        rangedl::detail::ensureCurlInitialized();
        rangedl::DownloaderConfig config;
        std::filesystem::path download_dir = std::filesystem::current_path();
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "-v") {
                rangedl::setLogLevel("debug");
                ++arg_index;
                continue;
            } else if (option == "-q") {
                rangedl::setLogLevel("warn");
                ++arg_index;
                continue;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            const char* value = argv[arg_index + 1];

            if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                config.worker_count = parseNumber(option, value);
            } else if (option == "-c") {
                const int kib = parseNumber(option, value);
                if (kib <= 0) {
                    throw std::runtime_error("Chunk size is invalid.");
                }
                config.chunk_size = static_cast<std::uint64_t>(kib) * 1024;
            } else if (option == "-r") {
                config.max_retries = parseNumber(option, value);
            } else if (option == "-b") {
                config.retry_backoff = std::chrono::seconds(parseNumber(option, value));
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        config.validate();
        auto log = rangedl::logger();
        log->debug("libcurl {}", rangedl::detail::curlVersion());

        auto transport = std::make_shared<rangedl::CurlRangeTransport>(config.transport);
        rangedl::DownloadManager manager(config, transport);

        bool probe_failed = false;
        for (int i = arg_index; i < argc; i += 2) {
            const std::string url = argv[i];
            const std::filesystem::path destination = download_dir / argv[i + 1];

            const auto meta = rangedl::probeRemoteFile(url, config.transport);
            if (!meta.downloadable()) {
                log->error("{}: server does not report a size with byte-range support (HTTP {})",
                           url, meta.http_status);
                probe_failed = true;
                continue;
            }

            rangedl::FileDescriptor file;
            file.id = i - arg_index;
            file.name = destination.filename().string();
            file.size = *meta.content_length;
            file.download_url = url;
            manager.addTask(std::move(file), destination.string());
        }

        manager.start();

        if (manager.hasErrors()) {
            manager.printErrors(std::cerr);
            return 1;
        }
        return probe_failed ? 1 : 0;
    } catch (const rangedl::DownloadError& ex) {
        std::cerr << "Fatal " << rangedl::errorKindName(ex.kind()) << " error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
