#include "console_server.h"
#include <iostream>

ConsoleServer::ConsoleServer(DiagnosticCommands& commands, const CadenceController& controller,
                             int receive_port, const std::string& reply_ip, int reply_port)
    : m_commands(commands), m_controller(controller), m_status_enabled(reply_port > 0) {
    m_udp_handler = std::make_unique<UDPHandler>(receive_port, reply_ip, reply_port);
    m_session_uuid = JsonParser::generateUniqueId32();
}

ConsoleServer::~ConsoleServer() {
    stop();
}

bool ConsoleServer::start() {
    if (!m_udp_handler->start(
            [this](const std::string& msg, const UdpPeer& from) {
                this->on_message_received(msg, from);
            })) {
        std::cerr << "[CONSOLE] Failed to start console server." << std::endl;
        return false;
    }
    std::cout << "[CONSOLE] Session UUID = " << m_session_uuid << std::endl;
    return true;
}

void ConsoleServer::stop() {
    if (m_udp_handler->is_running()) {
        m_udp_handler->stop();
        std::cout << "[CONSOLE] Stopped." << std::endl;
    }
}

void ConsoleServer::on_message_received(const std::string& message, const UdpPeer& from) {
    if (message.empty()) return;

    std::string reply = process_message(message);
    if (!reply.empty() && !m_udp_handler->send_to(from, reply)) {
        std::cerr << "[CONSOLE] Failed to send reply to " << from.to_string() << std::endl;
    }
}

std::string ConsoleServer::process_message(const std::string& message) {
    std::string trimmed = DiagnosticCommands::trim(message);
    if (trimmed.empty()) return "";

    // Bare text line.
    if (trimmed[0] != '{') {
        std::cout << "[CONSOLE] > " << trimmed << std::endl;
        std::string output;
        m_commands.execute_line(trimmed, output);
        return output;
    }

    int msg_id = JsonParser::getMessageId(trimmed);
    switch (static_cast<MessageId>(msg_id)) {
        case MessageId::CONSOLE_COMMAND: {
            ConsoleCommand cmd;
            if (!JsonParser::parseConsoleCommand(trimmed, cmd)) {
                return JsonParser::createCommandReply(
                    JsonParser::getUniqueId(trimmed), "", false, "Malformed command message");
            }
            std::cout << "[CONSOLE] > " << cmd.command << " " << cmd.argument << std::endl;
            std::string output;
            bool ok = m_commands.execute(cmd.command, cmd.argument, output);
            return JsonParser::createCommandReply(cmd.unique_id, cmd.command, ok, output);
        }

        default:
            std::cerr << "[CONSOLE] Unknown message ID: " << msg_id << std::endl;
            return "";
    }
}

PacerStatusReport ConsoleServer::build_status_report() const {
    PacerStats stats = m_controller.get_stats();
    int64_t frequency = m_controller.get_clock_frequency();

    PacerStatusReport report;
    report.target_rate = m_controller.get_target();
    report.interval_ticks = m_controller.get_interval_ticks();
    report.state = m_controller.get_state_name();
    report.ticks = stats.ticks;
    report.waits = stats.waits;
    report.late_ticks = stats.late_ticks;
    report.resyncs = stats.resyncs;
    report.max_overshoot_us = frequency > 0
        ? static_cast<double>(stats.max_overshoot_ticks) * 1.0e6 / static_cast<double>(frequency)
        : 0.0;
    return report;
}

void ConsoleServer::send_status_update() {
    // reply_port 0 turns status pushes off.
    if (!m_status_enabled || !m_udp_handler->is_running()) return;
    if (!m_udp_handler->send(JsonParser::createPacerStatus(build_status_report(), m_session_uuid))) {
        std::cerr << "[CONSOLE] Failed to send status update." << std::endl;
    }
}
