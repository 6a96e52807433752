#pragma once
#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <condition_variable>
#include "../communication/udp_handler.h"

// Scripted console client for manual end-to-end checks against a running pacer.
class VirtualConsole {
public:
    VirtualConsole(int receive_port, const std::string& pacer_ip, int pacer_port);

    // Sends each "command argument" line and waits for its reply.
    // Returns the number of commands that got an ok reply.
    int run_script(const std::vector<std::string>& lines, int reply_timeout_ms);
    void on_message_received(const std::string& message);

private:
    std::unique_ptr<UDPHandler> m_udp_handler;
    std::string m_session_uuid;

    std::string m_pending_id;
    bool m_reply_received = false;
    bool m_reply_ok = false;
    std::mutex m_state_mutex;
    std::condition_variable m_reply_cv;
};
