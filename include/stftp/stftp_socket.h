/**
 * @file stftp_socket.h
 * @brief UDP socket RAII wrapper
 */

#ifndef STFTP_SOCKET_H_
#define STFTP_SOCKET_H_

#include "stftp/stftp_common.h"
#include <memory>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace stftp {
namespace net {

using socket_t = int;
constexpr socket_t kInvalidSocket = -1;

// Forward declaration for pimpl
namespace internal {
class SocketImpl;
}

/**
 * @brief IPv4 address and port
 */
class STFTP_EXPORT SocketAddress {
public:
    /**
     * @brief Default constructor, 0.0.0.0:0
     */
    SocketAddress();

    /**
     * @brief Constructor with IPv4 address and port
     * @param ip Dotted quad; empty or unparsable means INADDR_ANY
     * @param port Port number
     */
    SocketAddress(const std::string& ip, uint16_t port);

    /**
     * @brief Constructor with sockaddr_in
     */
    explicit SocketAddress(const sockaddr_in& addr);

    const sockaddr_in& GetSockAddr() const { return addr_; }
    sockaddr_in& GetSockAddr() { return addr_; }

    std::string GetIP() const;
    uint16_t GetPort() const;

    /**
     * @brief Set IP address and port
     */
    void Set(const std::string& ip, uint16_t port);

    /**
     * @brief Same address, different port
     */
    SocketAddress WithPort(uint16_t port) const;

    // "ip:port", for logging
    std::string ToString() const;

    bool operator==(const SocketAddress& other) const;
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }

private:
    sockaddr_in addr_;
};

/**
 * @brief Move-only UDP socket, closed on destruction
 *
 * Uses the pimpl idiom to keep the POSIX details out of the header.
 * Calls interrupted by a signal are retried.
 */
class STFTP_EXPORT UdpSocket {
public:
    /**
     * @brief Default constructor - creates an invalid socket
     */
    UdpSocket();

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Destructor - automatically closes socket
     */
    ~UdpSocket();

    // Disable copy constructor and copy assignment
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Create a UDP socket
     * @return true if successful, false on error
     */
    bool Create();

    /**
     * @brief Bind socket to an address
     * @param addr Address to bind to; port 0 picks an ephemeral port
     * @return true if successful, false on error
     */
    bool Bind(const SocketAddress& addr);

    /**
     * @brief Fix the peer for Send and Receive
     * @param addr Peer address
     * @return true if successful, false on error
     */
    bool Connect(const SocketAddress& addr);

    /**
     * @brief Set socket option SO_REUSEADDR
     */
    bool SetReuseAddress(bool reuse = true);

    /**
     * @brief Set SO_RCVTIMEO; an expired wait fails the receive
     * @param timeout_ms Timeout in milliseconds, 0 blocks forever
     */
    bool SetReadTimeout(int timeout_ms);

    /**
     * @brief Set SO_SNDTIMEO
     * @param timeout_ms Timeout in milliseconds, 0 blocks forever
     */
    bool SetWriteTimeout(int timeout_ms);

    /**
     * @brief Send a datagram to the connected peer
     * @return Number of bytes sent, or -1 on error
     */
    int Send(const void* data, size_t size);

    /**
     * @brief Send a datagram to a specific address
     * @return Number of bytes sent, or -1 on error
     */
    int SendTo(const void* data, size_t size, const SocketAddress& addr);

    /**
     * @brief Receive a datagram from the connected peer
     * @return Number of bytes received, or -1 on error or timeout
     */
    int Receive(void* buffer, size_t buffer_size);

    /**
     * @brief Receive a datagram from any address
     * @param sender_addr Address of sender (output parameter)
     * @return Number of bytes received, or -1 on error or timeout
     */
    int ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr);

    /**
     * @brief Address the socket is bound to
     * @param addr Out: local address
     * @return true if successful, false on error
     */
    bool GetLocalAddress(SocketAddress& addr) const;

    /**
     * @brief Close the socket
     */
    void Close();

    bool IsValid() const;

    /**
     * @brief Check if the last failed receive or send hit the socket timeout
     */
    bool TimedOut() const;

    /**
     * @brief Get the last error message
     */
    std::string GetLastError() const;

    socket_t GetNativeHandle() const;

private:
    std::unique_ptr<internal::SocketImpl> impl_;
};

} // namespace net
} // namespace stftp

#endif // STFTP_SOCKET_H_
