#pragma once

#include <string>

// Default UDP ports of the pacer console
#define PACER_CONSOLE_RECEIVE_PORT 3800
#define PACER_CONSOLE_REPLY_PORT 3900

// Packet Size Constraint
const int MAX_PACKET_SIZE = 1024;

// Message IDs of the pacer console protocol
enum class MessageId {
    CONSOLE_COMMAND = 2601,

    COMMAND_REPLY = 2701,
    PACER_STATUS = 2702
};

struct ConsoleCommand {
    std::string unique_id;
    std::string command;
    std::string argument;
};

struct PacerStatusReport {
    double target_rate = 0.0;
    long long interval_ticks = 0;
    std::string state;
    unsigned long long ticks = 0;
    unsigned long long waits = 0;
    unsigned long long late_ticks = 0;
    unsigned long long resyncs = 0;
    double max_overshoot_us = 0.0;
};
