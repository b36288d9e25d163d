/**
 * @file stftp_packet_socket.h
 * @brief Packet level datagram channel used by transfers and listeners
 */

#ifndef STFTP_PACKET_SOCKET_H_
#define STFTP_PACKET_SOCKET_H_

#include "stftp/stftp_common.h"
#include "stftp/stftp_packet.h"
#include "stftp/stftp_socket.h"
#include <string>
#include <vector>

namespace stftp {

// Outcome of receiving one packet
enum class ReceiveStatus {
    kOk,
    kTimeout,     // the socket read timeout expired
    kIoError,     // the transport failed
    kMalformed    // a datagram arrived but did not decode
};

/**
 * @class PacketSocket
 * @brief Abstract packet channel to one peer
 *
 * A packet produced by ReceivePacket may borrow the socket's receive buffer
 * (DATA payloads do) and is only valid until the next receive.
 */
class STFTP_EXPORT PacketSocket {
public:
    virtual ~PacketSocket() = default;

    /**
     * @brief Encode and send a packet to the connected peer
     * @return true if the whole datagram was sent
     */
    virtual bool SendPacket(const Packet& packet) = 0;

    /**
     * @brief Send an already framed datagram to the connected peer
     * @return true if the whole datagram was sent
     */
    virtual bool SendDatagram(const uint8_t* data, size_t size) = 0;

    /**
     * @brief Receive and decode the next datagram
     * @param packet Out: decoded packet
     * @param sender Out: sender address, may be nullptr
     * @return kOk, kTimeout, kIoError or kMalformed
     */
    virtual ReceiveStatus ReceivePacket(Packet& packet, net::SocketAddress* sender) = 0;

    virtual std::string GetLastError() const = 0;
};

/**
 * @class TftpSocket
 * @brief PacketSocket over a UDP socket
 */
class STFTP_EXPORT TftpSocket : public PacketSocket {
public:
    TftpSocket();

    /**
     * @brief Create the socket and bind it
     * @param local Local address; port 0 picks an ephemeral port
     * @param reuse_address Set SO_REUSEADDR before binding
     * @return true if successful
     */
    bool Open(const net::SocketAddress& local, bool reuse_address = false);

    /**
     * @brief Fix the peer of SendPacket, SendDatagram and ReceivePacket
     */
    bool Connect(const net::SocketAddress& peer);

    bool SetReadTimeout(int timeout_ms);
    bool SetWriteTimeout(int timeout_ms);

    bool SendPacket(const Packet& packet) override;
    bool SendDatagram(const uint8_t* data, size_t size) override;
    ReceiveStatus ReceivePacket(Packet& packet, net::SocketAddress* sender) override;

    /**
     * @brief Encode and send a packet to an explicit address
     */
    bool SendPacketTo(const Packet& packet, const net::SocketAddress& address);

    bool GetLocalAddress(net::SocketAddress& addr) const;
    bool IsOpen() const { return socket_.IsValid(); }
    void Close() { socket_.Close(); }

    std::string GetLastError() const override { return last_error_; }

private:
    bool EncodeOutgoing(const Packet& packet, size_t& size);

    net::UdpSocket socket_;
    bool connected_;
    net::SocketAddress peer_;
    std::vector<uint8_t> send_buffer_;
    std::vector<uint8_t> receive_buffer_;
    mutable std::string last_error_;
};

} // namespace stftp

#endif // STFTP_PACKET_SOCKET_H_
