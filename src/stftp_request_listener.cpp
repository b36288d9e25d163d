#include "stftp/stftp_server.h"
#include "stftp/stftp_logger.h"
#include <sstream>

namespace stftp {

RequestListener::RequestListener()
    : transfer_read_timeout_ms_(kDefaultTimeout * 1000),
      transfer_write_timeout_ms_(kDefaultTimeout * 1000) {
}

bool RequestListener::Bind(const net::SocketAddress& address) {
    if (!socket_.Open(address, true)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

bool RequestListener::SetReadTimeout(int timeout_ms) {
    if (!socket_.SetReadTimeout(timeout_ms)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

bool RequestListener::SetWriteTimeout(int timeout_ms) {
    if (!socket_.SetWriteTimeout(timeout_ms)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

void RequestListener::SetTransferTimeouts(int read_ms, int write_ms) {
    transfer_read_timeout_ms_ = read_ms;
    transfer_write_timeout_ms_ = write_ms;
}

ReceiveStatus RequestListener::ReceiveRequest(Packet& request, net::SocketAddress& sender) {
    Packet packet;
    ReceiveStatus status = socket_.ReceivePacket(packet, &sender);
    if (status != ReceiveStatus::kOk) {
        last_error_ = socket_.GetLastError();
        return status;
    }
    if (!packet.IsRequest()) {
        std::ostringstream oss;
        oss << "Expected a request, received " << packet.GetOpCode();
        last_error_ = oss.str();
        return ReceiveStatus::kMalformed;
    }
    request = std::move(packet);
    return ReceiveStatus::kOk;
}

bool RequestListener::SendErrorTo(ErrorCode code, const std::string& message,
                                  const net::SocketAddress& target) {
    if (!socket_.SendPacketTo(Packet::CreateError(code, message), target)) {
        last_error_ = socket_.GetLastError();
        return false;
    }
    return true;
}

std::unique_ptr<Transfer> RequestListener::CreateTransferTo(const net::SocketAddress& target,
                                                            std::unique_ptr<ByteSource> source,
                                                            const AckOptions& options) {
    net::SocketAddress local;
    if (!socket_.GetLocalAddress(local)) {
        last_error_ = socket_.GetLastError();
        return nullptr;
    }

    auto transfer_socket = std::make_unique<TftpSocket>();
    if (!transfer_socket->Open(local.WithPort(0)) ||
        !transfer_socket->Connect(target) ||
        !transfer_socket->SetReadTimeout(transfer_read_timeout_ms_) ||
        !transfer_socket->SetWriteTimeout(transfer_write_timeout_ms_)) {
        last_error_ = transfer_socket->GetLastError();
        STFTP_ERROR("Cannot open transfer socket for %s: %s",
                    target.ToString().c_str(), last_error_.c_str());
        return nullptr;
    }

    net::SocketAddress transfer_address;
    if (transfer_socket->GetLocalAddress(transfer_address)) {
        STFTP_DEBUG("Transfer endpoint %s -> %s",
                    transfer_address.ToString().c_str(), target.ToString().c_str());
    }

    return std::make_unique<Transfer>(std::move(transfer_socket), std::move(source), options);
}

bool RequestListener::GetLocalAddress(net::SocketAddress& addr) const {
    return socket_.GetLocalAddress(addr);
}

} // namespace stftp
