#include "json_parser.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <random>
#include <ctime>

// --- Utility Functions ---

std::string JsonParser::generateUniqueId32() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint32_t> distrib(0, 0xFFFFFFFF);

    auto genHex = [&](int width) {
        std::stringstream ss;
        ss << std::hex << std::setw(width) << std::setfill('0')
           << (distrib(gen) & ((width >= 8) ? 0xFFFFFFFFu : ((1u << (4 * width)) - 1)));
        return ss.str();
    };

    // UUID v4 format: 8-4-4-4-12
    std::stringstream uuid;
    uuid << genHex(8) << "-"
         << genHex(4) << "-"
         << "4" << genHex(3) << "-"                         // version 4
         << std::hex << (8 + distrib(gen) % 4) << genHex(3) << "-" // variant 10xx
         << genHex(4) << genHex(8);

    return uuid.str();
}

std::string JsonParser::getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t_now, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

int JsonParser::getMessageId(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_object() && j.contains("message_id") && j["message_id"].is_number_integer()) {
        return j["message_id"].get<int>();
    }
    return -1;
}

std::string JsonParser::getUniqueId(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_object() && j.contains("message_unique_id") && j["message_unique_id"].is_string()) {
        return j["message_unique_id"].get<std::string>();
    }
    return "";
}

// --- Console client -> Pacer ---

std::string JsonParser::createConsoleCommand(const std::string& command,
                                             const std::string& argument,
                                             std::string session_uuid) {
    json j;
    j["message_id"] = static_cast<int>(MessageId::CONSOLE_COMMAND);
    j["message_type"] = "CMD";
    j["message_unique_id"] = session_uuid;
    j["message_text"] = {
        {"command", command},
        {"argument", argument},
        {"timestamp", getCurrentTimestamp()}
    };
    return j.dump();
}

bool JsonParser::parseConsoleCommand(const std::string& json_str, ConsoleCommand& out) {
    try {
        json j = json::parse(json_str);
        if (j.at("message_id").get<int>() != static_cast<int>(MessageId::CONSOLE_COMMAND)) {
            return false;
        }
        const auto& msg_text = j.at("message_text");
        out.unique_id = j.value("message_unique_id", std::string());
        out.command = msg_text.at("command").get<std::string>();
        out.argument = msg_text.value("argument", std::string());
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[JSON] Malformed console command: " << e.what() << std::endl;
        return false;
    }
}

// --- Pacer -> Console client ---

std::string JsonParser::createCommandReply(std::string unique_id_from_req,
                                           const std::string& command,
                                           bool ok,
                                           const std::string& output) {
    json j;
    j["message_id"] = static_cast<int>(MessageId::COMMAND_REPLY);
    j["message_type"] = "CMD_REPLY";
    j["message_unique_id"] = unique_id_from_req;
    j["message_text"] = {
        {"command", command},
        {"ok", ok},
        {"output", output},
        {"timestamp", getCurrentTimestamp()}
    };
    return j.dump();
}

std::string JsonParser::createPacerStatus(const PacerStatusReport& report,
                                          std::string session_uuid) {
    json j;
    j["message_id"] = static_cast<int>(MessageId::PACER_STATUS);
    j["message_type"] = "STATUS";
    j["message_unique_id"] = session_uuid;
    j["message_text"] = {
        {"target_rate", report.target_rate},
        {"interval_ticks", report.interval_ticks},
        {"state", report.state},
        {"ticks", report.ticks},
        {"waits", report.waits},
        {"late_ticks", report.late_ticks},
        {"resyncs", report.resyncs},
        {"max_overshoot_us", report.max_overshoot_us},
        {"time", getCurrentTimestamp()}
    };
    return j.dump();
}

bool JsonParser::parsePacerStatus(const std::string& json_str, PacerStatusReport& out) {
    try {
        json j = json::parse(json_str);
        if (j.at("message_id").get<int>() != static_cast<int>(MessageId::PACER_STATUS)) {
            return false;
        }
        const auto& msg_text = j.at("message_text");
        out.target_rate = msg_text.at("target_rate").get<double>();
        out.interval_ticks = msg_text.at("interval_ticks").get<long long>();
        out.state = msg_text.at("state").get<std::string>();
        out.ticks = msg_text.at("ticks").get<unsigned long long>();
        out.waits = msg_text.at("waits").get<unsigned long long>();
        out.late_ticks = msg_text.at("late_ticks").get<unsigned long long>();
        out.resyncs = msg_text.at("resyncs").get<unsigned long long>();
        out.max_overshoot_us = msg_text.at("max_overshoot_us").get<double>();
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[JSON] Malformed pacer status: " << e.what() << std::endl;
        return false;
    }
}
