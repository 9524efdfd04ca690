// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/sim_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace arena::cfg {

struct ServerConfig
{
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{5555};
    uint32_t tick_rate{30};
    arena::game::SimConfig sim;
    // Snapshot frames buffered per connection before the client is considered too slow.
    uint32_t max_outbound_queue{64};
    uint32_t write_timeout_ms{250};
    // Time allowed between accept and the JOIN record.
    uint32_t join_timeout_ms{5000};
    std::string log_level{"info"};
    bool log_json{false};
    uint32_t metrics_interval_sec{60};
};

// Overrides only the keys present in the node; unknown keys are ignored.
void apply_overrides(ServerConfig &cfg, const YAML::Node &root);

// Throws YAML::Exception for unreadable / malformed files and std::invalid_argument
// when the resulting values are inconsistent.
ServerConfig load_config(const std::string &path);

void validate(const ServerConfig &cfg);

} // namespace arena::cfg
