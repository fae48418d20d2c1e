#include "celestiada/version.hpp"
#include "celestiada/sdk/BlobPointer.hpp"
#include "celestiada/sdk/CelestiaDAStub.hpp"
#include "celestiada/sdk/DAConfig.hpp"
#include "celestiada/sdk/KeyValueStore.hpp"
#include "celestiada/sdk/Logger.hpp"
#include "celestiada/sdk/NamespacedMerkleTree.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <getopt.h>

using namespace celestiada::sdk;

const std::string BUILD_DATE = __DATE__ " " __TIME__;

// Configuration
struct CommandLineOptions {
    std::string config_file;
    std::string log_level;
    std::string decode_hex;
    std::string stub_store_file;
    std::string stub_read_hex;
    std::vector<std::string> share_files;
    bool nmt_root = false;
    bool version = false;
    bool help = false;
};

// Parse command line arguments
CommandLineOptions parse_args(int argc, char* argv[]) {
    CommandLineOptions options;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"log-level", required_argument, 0, 'l'},
        {"decode", required_argument, 0, 'd'},
        {"nmt-root", no_argument, 0, 'n'},
        {"stub-store", required_argument, 0, 's'},
        {"stub-read", required_argument, 0, 'r'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:l:d:ns:r:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                options.config_file = optarg;
                break;
            case 'l':
                options.log_level = optarg;
                break;
            case 'd':
                options.decode_hex = optarg;
                break;
            case 'n':
                options.nmt_root = true;
                break;
            case 's':
                options.stub_store_file = optarg;
                break;
            case 'r':
                options.stub_read_hex = optarg;
                break;
            case 'v':
                options.version = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                options.help = true;
                break;
        }
    }

    // Remaining arguments are share files for --nmt-root
    for (int i = optind; i < argc; ++i) {
        options.share_files.push_back(argv[i]);
    }

    return options;
}

// Print usage information
void print_usage(const char* program_name) {
    std::cout << celestiada::Version::name << " " << celestiada::Version::str << " (" << BUILD_DATE << ")" << std::endl;
    std::cout << "Usage: " << program_name << " [options] [SHARE_FILE...]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config=FILE       Configuration file path" << std::endl;
    std::cout << "  -l, --log-level=LEVEL   Log level (trace, debug, info, warning, error, critical)" << std::endl;
    std::cout << "  -d, --decode=HEX        Decode a framed blob pointer" << std::endl;
    std::cout << "  -n, --nmt-root          Compute the NMT root over SHARE_FILE arguments, in order" << std::endl;
    std::cout << "  -s, --stub-store=FILE   Store FILE in the local stub DA and print its reference" << std::endl;
    std::cout << "  -r, --stub-read=HEX     Write the stub DA message referenced by HEX to stdout" << std::endl;
    std::cout << "  -v, --version           Print version information and exit" << std::endl;
    std::cout << "  -h, --help              Print this help message and exit" << std::endl;
}

// Print version information
void print_version() {
    std::cout << celestiada::Version::name << " " << celestiada::Version::str << " (" << BUILD_DATE << ")" << std::endl;
}

// Load configuration, falling back to the default location and then to built-in defaults
Result<DAConfig> load_config(const CommandLineOptions& options) {
    if (!options.config_file.empty()) {
        return DAConfig::load(options.config_file);
    }
    if (std::filesystem::exists(constants::CONFIG_FILE_PATH)) {
        return DAConfig::load(constants::CONFIG_FILE_PATH);
    }
    return DAConfig();
}

Result<ByteVector> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {ErrorCode::FILE_IO_ERROR, path};
    }
    ByteVector data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return {ErrorCode::FILE_IO_ERROR, path};
    }
    return data;
}

int decode_pointer(const std::string& hex) {
    auto framed = hex_to_bytes(hex);
    if (framed.is_err()) {
        std::cerr << "Invalid hex: " << framed.error_message() << std::endl;
        return 1;
    }

    auto pointer = BlobPointer::deserialize(framed.value());
    if (pointer.is_err()) {
        std::cerr << "Cannot decode blob pointer: " << pointer.error_message() << std::endl;
        return 1;
    }

    std::cout << pointer.value().to_string() << std::endl;
    return 0;
}

int compute_nmt_root(const std::vector<std::string>& files) {
    if (files.empty()) {
        std::cerr << "No share files given" << std::endl;
        return 1;
    }

    std::vector<ByteVector> shares;
    for (const auto& path : files) {
        auto share = read_file(path);
        if (share.is_err()) {
            std::cerr << "Cannot read share: " << share.error_message() << std::endl;
            return 1;
        }
        shares.push_back(std::move(share.value()));
    }

    MemoryKeyValueStore preimages;
    auto root = NamespacedMerkleTree::compute_root(shares, make_preimage_recorder(preimages));
    if (root.is_err()) {
        std::cerr << "Cannot compute NMT root: " << root.error_message() << std::endl;
        return 1;
    }

    std::cout << "root: " << bytes_to_hex(root.value()) << std::endl;
    std::cout << "preimages: " << preimages.size() << std::endl;
    return 0;
}

int stub_store(const DAConfig& config, const std::string& path) {
    auto message = read_file(path);
    if (message.is_err()) {
        std::cerr << "Cannot read message: " << message.error_message() << std::endl;
        return 1;
    }

    CelestiaDAStub stub(std::make_shared<LocalFileStorageService>(config.data_dir));
    auto reference = stub.store(message.value());
    if (reference.is_err()) {
        std::cerr << "Stub store failed: " << reference.error_message() << std::endl;
        return 1;
    }

    std::cout << bytes_to_hex(reference.value()) << std::endl;
    return 0;
}

int stub_read(const DAConfig& config, const std::string& hex) {
    auto reference = hex_to_bytes(hex);
    if (reference.is_err()) {
        std::cerr << "Invalid hex: " << reference.error_message() << std::endl;
        return 1;
    }

    CelestiaDAStub stub(std::make_shared<LocalFileStorageService>(config.data_dir));
    auto message = stub.read(reference.value());
    if (message.is_err()) {
        std::cerr << "Stub read failed: " << message.error_message() << std::endl;
        return 1;
    }

    std::cout.write(reinterpret_cast<const char*>(message.value().data()),
                    static_cast<std::streamsize>(message.value().size()));
    std::cout.flush();
    return 0;
}

int main(int argc, char* argv[]) {
    CommandLineOptions options = parse_args(argc, argv);

    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (options.version) {
        print_version();
        return 0;
    }

    auto config = load_config(options);
    if (config.is_err()) {
        std::cerr << "Failed to load configuration: " << config.error_message() << std::endl;
        return 1;
    }

    std::string log_level = options.log_level.empty() ? config.value().log_level : options.log_level;
    Logger::instance().set_log_level(Logger::level_from_string(log_level));
    if (!options.config_file.empty()) {
        Logger::instance().initialize(config.value().log_path, Logger::level_from_string(log_level));
    }

    try {
        if (!options.decode_hex.empty()) {
            return decode_pointer(options.decode_hex);
        }
        if (options.nmt_root) {
            return compute_nmt_root(options.share_files);
        }
        if (!options.stub_store_file.empty()) {
            return stub_store(config.value(), options.stub_store_file);
        }
        if (!options.stub_read_hex.empty()) {
            return stub_read(config.value(), options.stub_read_hex);
        }
    } catch (const std::exception& e) {
        Logger::instance().critical("Unhandled exception: " + std::string(e.what()));
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
