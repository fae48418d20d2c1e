#include "celestiada/sdk/DAConfig.hpp"
#include "celestiada/sdk/Namespace.hpp"
#include "celestiada/sdk/Logger.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pt = boost::property_tree;

namespace celestiada {
namespace sdk {

namespace {

DAConfig from_tree(const pt::ptree& tree) {
    DAConfig config;

    config.enable = tree.get<bool>("enable", config.enable);
    config.rpc = tree.get<std::string>("rpc", config.rpc);
    config.tendermint_rpc = tree.get<std::string>("tendermint-rpc", config.tendermint_rpc);
    config.namespace_id = tree.get<std::string>("namespace-id", config.namespace_id);
    config.auth_token = tree.get<std::string>("auth-token", config.auth_token);
    config.blobstream_address = tree.get<std::string>("blobstream-address", config.blobstream_address);
    config.poll_interval = std::chrono::milliseconds(
        tree.get<uint64_t>("poll-interval-ms", static_cast<uint64_t>(config.poll_interval.count())));
    config.max_poll_attempts = tree.get<uint64_t>("max-poll-attempts", config.max_poll_attempts);
    config.data_dir = tree.get<std::string>("data-dir", config.data_dir);
    config.log_path = tree.get<std::string>("log-path", config.log_path);
    config.log_level = tree.get<std::string>("log-level", config.log_level);

    return config;
}

} // namespace

Result<void> DAConfig::validate() const {
    if (!enable) {
        return ErrorCode::SUCCESS;
    }

    if (namespace_id.empty()) {
        return {ErrorCode::CONFIG_ERROR, "namespace id cannot be blank"};
    }

    auto ns = Namespace::from_v0_hex(namespace_id);
    if (ns.is_err()) {
        return {ErrorCode::CONFIG_ERROR, ns.error_message()};
    }

    if (poll_interval.count() <= 0) {
        return {ErrorCode::CONFIG_ERROR, "poll interval must be positive"};
    }

    return ErrorCode::SUCCESS;
}

Result<DAConfig> DAConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().error("Configuration file not found: " + path);
        return {ErrorCode::CONFIG_ERROR, "no such file: " + path};
    }

    std::ifstream file(path);
    if (!file) {
        Logger::instance().error("Failed to open configuration file: " + path);
        return {ErrorCode::CONFIG_ERROR, "cannot open " + path};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

Result<DAConfig> DAConfig::parse(const std::string& json) {
    try {
        pt::ptree tree;
        std::istringstream iss(json);
        pt::read_json(iss, tree);

        DAConfig config = from_tree(tree);

        auto valid = config.validate();
        if (valid.is_err()) {
            Logger::instance().error("Invalid DA configuration: " + valid.error_message());
            return {valid.error(), valid.error_detail()};
        }

        return config;

    } catch (const pt::ptree_error& e) {
        Logger::instance().error("Failed to parse DA configuration: " + std::string(e.what()));
        return {ErrorCode::CONFIG_ERROR, e.what()};
    }
}

} // namespace sdk
} // namespace celestiada
