#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace celestiada {
namespace sdk {

/**
 * @brief Configuration of the Celestia DA client
 *
 * JSON keys (all optional):
 *   enable, rpc, tendermint-rpc, namespace-id, auth-token,
 *   blobstream-address, poll-interval-ms, max-poll-attempts,
 *   data-dir, log-path, log-level
 */
struct DAConfig {
    bool enable = false;
    std::string rpc;
    std::string tendermint_rpc;
    std::string namespace_id;     // hex of the v0 user id
    std::string auth_token;
    std::string blobstream_address;
    std::chrono::milliseconds poll_interval = constants::DEFAULT_POLL_INTERVAL;
    uint64_t max_poll_attempts = 0; // 0 waits for as long as finality takes
    std::string data_dir = constants::DATA_DIR;
    std::string log_path = constants::LOG_PATH;
    std::string log_level = "info";

    // Check an enabled configuration is usable
    Result<void> validate() const;

    static Result<DAConfig> load(const std::string& path);

    static Result<DAConfig> parse(const std::string& json);
};

} // namespace sdk
} // namespace celestiada
