#pragma once

#include <string>
#include <thread>
#include <functional>
#include <atomic>
#include <cstdint>
#include <sys/socket.h>
#include <netinet/in.h>

// Source address of a received datagram, usable as a reply destination.
struct UdpPeer {
    sockaddr_in addr{};

    std::string to_string() const;
};

// One UDP socket: bound receive port, background receive thread, and sends
// either to a default destination or back to a given peer.
class UDPHandler {
public:
    using MessageCallback = std::function<void(const std::string& message, const UdpPeer& from)>;

    // receive_port 0 binds an ephemeral port. default_port 0 means no default
    // destination; send() then fails and only send_to() is usable.
    UDPHandler(int receive_port, const std::string& default_ip, int default_port);
    ~UDPHandler();

    bool start(MessageCallback callback);
    void stop();

    bool send(const std::string& message);
    bool send_to(const UdpPeer& peer, const std::string& message);

    bool is_running() const { return m_running; }
    int bound_port() const { return m_bound_port; }
    uint64_t datagrams_received() const { return m_received; }

private:
    bool open_socket();
    void close_socket();
    bool send_datagram(const sockaddr_in& dest, const std::string& message);
    void receive_loop();

    int m_receive_port;
    std::string m_default_ip;
    int m_default_port;

    int m_socket_fd = -1;
    int m_bound_port = 0;
    bool m_has_default = false;
    sockaddr_in m_default_addr{};

    std::thread m_receive_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_received{0};
    MessageCallback m_callback;
};
