#pragma once

#include "udp_handler.h"
#include "../core/cadence_controller.h"
#include "../core/diagnostic_commands.h"
#include "../messages/json_parser.h"

#include <memory>
#include <string>

// Remote diagnostic console over UDP. Accepts a JSON CMD envelope or a bare
// text line ("refresh_rate 30") and answers the sender in the same form.
// STATUS messages go to the configured reply address.
class ConsoleServer {
public:
    ConsoleServer(DiagnosticCommands& commands, const CadenceController& controller,
                  int receive_port, const std::string& reply_ip, int reply_port);
    ~ConsoleServer();

    bool start();
    void stop();

    void on_message_received(const std::string& message, const UdpPeer& from);
    // Returns the reply payload, empty when nothing should be sent back.
    std::string process_message(const std::string& message);
    void send_status_update();

    PacerStatusReport build_status_report() const;
    const std::string& session_uuid() const { return m_session_uuid; }
    int port() const { return m_udp_handler->bound_port(); }

private:
    DiagnosticCommands& m_commands;
    const CadenceController& m_controller;

    std::unique_ptr<UDPHandler> m_udp_handler;
    std::string m_session_uuid;
    bool m_status_enabled;
};
