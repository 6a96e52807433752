// src/core/pacer_config.h
#pragma once

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>
#include "precision_sleep.h"
#include "../messages/message_types.h"

enum class HostDriver {
    ASIO,
    THREAD
};

struct PacerConfig {
    // pacer
    double refresh_rate = 60.0;
    int64_t spin_threshold_ns = 80000;
    SleepKind sleep = SleepKind::AUTO;
    uint64_t stats_log_interval = 120;

    // host
    HostDriver driver = HostDriver::ASIO;
    int session_seconds = 0;          // 0 = until SIGINT/SIGTERM
    int status_interval_ms = 1000;    // 0 = no periodic status

    // console
    bool console_enabled = true;
    int console_receive_port = PACER_CONSOLE_RECEIVE_PORT;
    std::string console_reply_ip = "127.0.0.1";
    int console_reply_port = PACER_CONSOLE_REPLY_PORT;
};

// Missing keys keep their defaults. Throws YAML::Exception on malformed
// input and std::runtime_error on unknown enum values.
PacerConfig parse_pacer_config(const YAML::Node& root);
PacerConfig load_pacer_config_yaml(const std::string& filename);

HostDriver host_driver_from_string(const std::string& name);
std::string host_driver_to_string(HostDriver driver);
