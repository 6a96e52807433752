// src/core/pacer_config.cpp
#include "pacer_config.h"
#include <stdexcept>
#include <iostream>

HostDriver host_driver_from_string(const std::string& name) {
    if (name == "asio") return HostDriver::ASIO;
    if (name == "thread") return HostDriver::THREAD;
    throw std::runtime_error("Unknown host driver: " + name);
}

std::string host_driver_to_string(HostDriver driver) {
    switch (driver) {
        case HostDriver::ASIO: return "asio";
        case HostDriver::THREAD: return "thread";
        default: return "unknown";
    }
}

PacerConfig parse_pacer_config(const YAML::Node& root) {
    PacerConfig cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("pacer config root must be a map");
    }

    if (const YAML::Node pacer = root["pacer"]) {
        if (pacer["refresh_rate"]) {
            // .nan / .inf are accepted here; set_target() disables the limiter for them.
            cfg.refresh_rate = pacer["refresh_rate"].as<double>();
        }
        if (pacer["spin_threshold_ns"]) {
            cfg.spin_threshold_ns = pacer["spin_threshold_ns"].as<int64_t>();
            if (cfg.spin_threshold_ns < 0) {
                throw std::runtime_error("pacer.spin_threshold_ns must be >= 0");
            }
        }
        if (pacer["sleep"]) {
            cfg.sleep = sleep_kind_from_string(pacer["sleep"].as<std::string>());
        }
        if (pacer["stats_log_interval"]) {
            cfg.stats_log_interval = pacer["stats_log_interval"].as<uint64_t>();
        }
    }

    if (const YAML::Node host = root["host"]) {
        if (host["driver"]) {
            cfg.driver = host_driver_from_string(host["driver"].as<std::string>());
        }
        if (host["session_seconds"]) {
            cfg.session_seconds = host["session_seconds"].as<int>();
        }
        if (host["status_interval_ms"]) {
            cfg.status_interval_ms = host["status_interval_ms"].as<int>();
        }
    }

    if (const YAML::Node console = root["console"]) {
        if (console["enabled"]) {
            cfg.console_enabled = console["enabled"].as<bool>();
        }
        if (console["receive_port"]) {
            cfg.console_receive_port = console["receive_port"].as<int>();
        }
        if (console["reply_ip"]) {
            cfg.console_reply_ip = console["reply_ip"].as<std::string>();
        }
        if (console["reply_port"]) {
            cfg.console_reply_port = console["reply_port"].as<int>();
        }
    }

    return cfg;
}

PacerConfig load_pacer_config_yaml(const std::string& filename) {
    YAML::Node root = YAML::LoadFile(filename);
    PacerConfig cfg = parse_pacer_config(root);
    std::cout << "[CONFIG] Loaded " << filename
              << ": refresh_rate=" << cfg.refresh_rate
              << " sleep=" << sleep_kind_to_string(cfg.sleep)
              << " driver=" << host_driver_to_string(cfg.driver)
              << " console=" << (cfg.console_enabled ? "on" : "off") << std::endl;
    return cfg;
}
