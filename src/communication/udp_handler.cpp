#include "udp_handler.h"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/time.h>
#include "../messages/message_types.h"

// recvfrom() wakes at least this often to notice stop().
static const int RECEIVE_TIMEOUT_MS = 200;

std::string UdpPeer::to_string() const {
    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
        return "?";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

UDPHandler::UDPHandler(int receive_port, const std::string& default_ip, int default_port)
    : m_receive_port(receive_port), m_default_ip(default_ip), m_default_port(default_port) {}

UDPHandler::~UDPHandler() {
    stop();
}

bool UDPHandler::start(MessageCallback callback) {
    if (m_running) {
        std::cerr << "[UDP] Handler already running." << std::endl;
        return false;
    }

    m_has_default = false;
    if (m_default_port > 0) {
        m_default_addr = sockaddr_in{};
        m_default_addr.sin_family = AF_INET;
        m_default_addr.sin_port = htons(static_cast<uint16_t>(m_default_port));
        if (inet_pton(AF_INET, m_default_ip.c_str(), &m_default_addr.sin_addr) <= 0) {
            std::cerr << "[UDP] Invalid address " << m_default_ip << std::endl;
            return false;
        }
        m_has_default = true;
    }

    if (!open_socket()) {
        return false;
    }

    m_callback = std::move(callback);
    m_running = true;
    m_receive_thread = std::thread(&UDPHandler::receive_loop, this);

    std::cout << "[UDP] Listening on port " << m_bound_port;
    if (m_has_default) {
        std::cout << ", default destination " << m_default_ip << ":" << m_default_port;
    }
    std::cout << std::endl;
    return true;
}

bool UDPHandler::open_socket() {
    m_socket_fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_socket_fd < 0) {
        std::cerr << "[UDP] socket creation failed: " << strerror(errno) << std::endl;
        return false;
    }

    int reuse = 1;
    if (setsockopt(m_socket_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        std::cerr << "[UDP] SO_REUSEADDR failed: " << strerror(errno) << std::endl;
    }

    timeval tv{};
    tv.tv_usec = RECEIVE_TIMEOUT_MS * 1000;
    if (setsockopt(m_socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        std::cerr << "[UDP] SO_RCVTIMEO failed: " << strerror(errno) << std::endl;
        close_socket();
        return false;
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(static_cast<uint16_t>(m_receive_port));
    if (bind(m_socket_fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
        std::cerr << "[UDP] bind to port " << m_receive_port << " failed: "
                  << strerror(errno) << std::endl;
        close_socket();
        return false;
    }

    socklen_t len = sizeof(local);
    if (getsockname(m_socket_fd, reinterpret_cast<sockaddr*>(&local), &len) < 0) {
        std::cerr << "[UDP] getsockname failed: " << strerror(errno) << std::endl;
        close_socket();
        return false;
    }
    m_bound_port = ntohs(local.sin_port);
    return true;
}

void UDPHandler::close_socket() {
    if (m_socket_fd != -1) {
        close(m_socket_fd);
        m_socket_fd = -1;
    }
    m_bound_port = 0;
}

void UDPHandler::stop() {
    m_running = false;
    if (m_receive_thread.joinable()) {
        m_receive_thread.join();
    }
    close_socket();
}

bool UDPHandler::send(const std::string& message) {
    if (!m_has_default) {
        std::cerr << "[UDP] No default destination configured." << std::endl;
        return false;
    }
    return send_datagram(m_default_addr, message);
}

bool UDPHandler::send_to(const UdpPeer& peer, const std::string& message) {
    return send_datagram(peer.addr, message);
}

bool UDPHandler::send_datagram(const sockaddr_in& dest, const std::string& message) {
    if (m_socket_fd < 0) {
        return false;
    }
    if (message.size() > static_cast<size_t>(MAX_PACKET_SIZE)) {
        std::cerr << "[UDP] Message of " << message.size() << " bytes exceeds "
                  << MAX_PACKET_SIZE << " byte limit." << std::endl;
        return false;
    }

    ssize_t sent = sendto(m_socket_fd, message.data(), message.size(), 0,
                          reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        std::cerr << "[UDP] sendto failed: " << strerror(errno) << std::endl;
        return false;
    }
    return static_cast<size_t>(sent) == message.size();
}

void UDPHandler::receive_loop() {
    char buffer[MAX_PACKET_SIZE];

    while (m_running) {
        UdpPeer from;
        socklen_t len = sizeof(from.addr);
        ssize_t n = recvfrom(m_socket_fd, buffer, sizeof(buffer), 0,
                             reinterpret_cast<sockaddr*>(&from.addr), &len);
        if (n > 0) {
            ++m_received;
            if (m_callback) {
                m_callback(std::string(buffer, static_cast<size_t>(n)), from);
            }
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            std::cerr << "[UDP] recvfrom failed: " << strerror(errno) << std::endl;
        }
    }
}
