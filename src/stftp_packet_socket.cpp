#include "stftp/stftp_packet_socket.h"
#include "stftp/stftp_logger.h"

namespace stftp {

TftpSocket::TftpSocket()
    : connected_(false),
      send_buffer_(kMaxPacketSize),
      receive_buffer_(kReceiveBufferSize) {
}

bool TftpSocket::Open(const net::SocketAddress& local, bool reuse_address) {
    connected_ = false;
    if (!socket_.Create()) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    if (reuse_address && !socket_.SetReuseAddress(true)) {
        last_error_ = socket_.GetLastError();
        socket_.Close();
        return false;
    }
    if (!socket_.Bind(local)) {
        last_error_ = socket_.GetLastError();
        socket_.Close();
        return false;
    }
    return true;
}

bool TftpSocket::Connect(const net::SocketAddress& peer) {
    if (!socket_.Connect(peer)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    connected_ = true;
    peer_ = peer;
    return true;
}

bool TftpSocket::SetReadTimeout(int timeout_ms) {
    if (!socket_.SetReadTimeout(timeout_ms)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

bool TftpSocket::SetWriteTimeout(int timeout_ms) {
    if (!socket_.SetWriteTimeout(timeout_ms)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

bool TftpSocket::EncodeOutgoing(const Packet& packet, size_t& size) {
    PacketStatus status = packet.Encode(send_buffer_.data(), send_buffer_.size(), size);
    if (!status.Ok()) {
        last_error_ = std::string("Cannot encode packet: ") + ParseErrorToString(status.error);
        STFTP_ERROR("%s", last_error_.c_str());
        return false;
    }
    return true;
}

bool TftpSocket::SendPacket(const Packet& packet) {
    size_t size = 0;
    if (!EncodeOutgoing(packet, size)) {
        return false;
    }
    return SendDatagram(send_buffer_.data(), size);
}

bool TftpSocket::SendDatagram(const uint8_t* data, size_t size) {
    if (!connected_) {
        last_error_ = "Socket is not connected";
        return false;
    }
    int sent = socket_.Send(data, size);
    if (sent < 0) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    if (static_cast<size_t>(sent) != size) {
        last_error_ = "Datagram truncated on send";
        return false;
    }
    return true;
}

bool TftpSocket::SendPacketTo(const Packet& packet, const net::SocketAddress& address) {
    size_t size = 0;
    if (!EncodeOutgoing(packet, size)) {
        return false;
    }
    int sent = socket_.SendTo(send_buffer_.data(), size, address);
    if (sent < 0) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    if (static_cast<size_t>(sent) != size) {
        last_error_ = "Datagram truncated on send";
        return false;
    }
    return true;
}

ReceiveStatus TftpSocket::ReceivePacket(Packet& packet, net::SocketAddress* sender) {
    net::SocketAddress from;
    int received = connected_
        ? socket_.Receive(receive_buffer_.data(), receive_buffer_.size())
        : socket_.ReceiveFrom(receive_buffer_.data(), receive_buffer_.size(), from);
    if (received < 0) {
        last_error_ = socket_.GetLastError();
        return socket_.TimedOut() ? ReceiveStatus::kTimeout : ReceiveStatus::kIoError;
    }

    if (sender != nullptr) {
        // A connected socket only delivers datagrams from its peer
        *sender = connected_ ? peer_ : from;
    }

    PacketStatus status = Packet::Decode(receive_buffer_.data(), static_cast<size_t>(received), packet);
    if (!status.Ok()) {
        last_error_ = std::string("Malformed datagram: ") + ParseErrorToString(status.error);
        return ReceiveStatus::kMalformed;
    }
    return ReceiveStatus::kOk;
}

bool TftpSocket::GetLocalAddress(net::SocketAddress& addr) const {
    if (!socket_.GetLocalAddress(addr)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

} // namespace stftp
