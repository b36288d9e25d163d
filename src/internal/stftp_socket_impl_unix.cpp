/**
 * @file stftp_socket_impl_unix.cpp
 * @brief Unix/Linux socket implementation
 */

#include "internal/stftp_socket_impl.h"
#include <sys/time.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>

namespace stftp {
namespace net {
namespace internal {

SocketImpl::SocketImpl() : socket_(kInvalidSocket), timed_out_(false) {
}

SocketImpl::~SocketImpl() {
    Close();
}

bool SocketImpl::Create() {
    Close(); // Close any existing socket

    socket_ = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (socket_ == kInvalidSocket) {
        SetSystemError("Failed to create UDP socket", errno);
        STFTP_ERROR("%s", last_error_.c_str());
        return false;
    }

    STFTP_TRACE("UDP socket created (fd: %d)", socket_);
    return true;
}

bool SocketImpl::Bind(const SocketAddress& addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot bind invalid socket");
        return false;
    }

    const sockaddr_in& sock_addr = addr.GetSockAddr();
    if (bind(socket_, reinterpret_cast<const sockaddr*>(&sock_addr), sizeof(sock_addr)) != 0) {
        SetSystemError("Failed to bind socket", errno);
        STFTP_ERROR("Failed to bind socket to %s - %s",
                    addr.ToString().c_str(), last_error_.c_str());
        return false;
    }

    STFTP_TRACE("Socket bound to %s", addr.ToString().c_str());
    return true;
}

bool SocketImpl::Connect(const SocketAddress& addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot connect invalid socket");
        return false;
    }

    const sockaddr_in& sock_addr = addr.GetSockAddr();
    int result;
    do {
        result = connect(socket_, reinterpret_cast<const sockaddr*>(&sock_addr), sizeof(sock_addr));
    } while (result != 0 && errno == EINTR);

    if (result != 0) {
        SetSystemError("Failed to connect socket", errno);
        STFTP_ERROR("Failed to connect socket to %s - %s",
                    addr.ToString().c_str(), last_error_.c_str());
        return false;
    }

    STFTP_TRACE("Socket connected to %s", addr.ToString().c_str());
    return true;
}

bool SocketImpl::SetReuseAddress(bool reuse) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot set option on invalid socket");
        return false;
    }

    int opt = reuse ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        SetSystemError("Failed to set SO_REUSEADDR", errno);
        STFTP_WARN("%s", last_error_.c_str());
        return false;
    }
    return true;
}

bool SocketImpl::SetTimeout(int option, int timeout_ms) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot set option on invalid socket");
        return false;
    }
    if (timeout_ms < 0) {
        SetLastError("Negative socket timeout");
        return false;
    }

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(socket_, SOL_SOCKET, option, &timeout, sizeof(timeout)) != 0) {
        SetSystemError(option == SO_RCVTIMEO ? "Failed to set SO_RCVTIMEO"
                                             : "Failed to set SO_SNDTIMEO", errno);
        STFTP_WARN("%s", last_error_.c_str());
        return false;
    }
    return true;
}

int SocketImpl::Send(const void* data, size_t size) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot send on invalid socket");
        return -1;
    }
    if (data == nullptr && size > 0) {
        SetLastError("Invalid send parameters");
        return -1;
    }

    ssize_t sent;
    do {
        sent = send(socket_, data, size, 0);
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        SetSystemError("Failed to send data", errno);
        STFTP_ERROR("Failed to send %zu bytes - %s", size, last_error_.c_str());
        return -1;
    }
    if (static_cast<size_t>(sent) != size) {
        STFTP_WARN("Partial send: %zd bytes sent out of %zu", sent, size);
    }
    timed_out_ = false;
    return static_cast<int>(sent);
}

int SocketImpl::SendTo(const void* data, size_t size, const SocketAddress& addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot send on invalid socket");
        return -1;
    }
    if (data == nullptr && size > 0) {
        SetLastError("Invalid send parameters");
        return -1;
    }

    const sockaddr_in& sock_addr = addr.GetSockAddr();
    ssize_t sent;
    do {
        sent = sendto(socket_, data, size, 0,
                      reinterpret_cast<const sockaddr*>(&sock_addr), sizeof(sock_addr));
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        SetSystemError("Failed to send data", errno);
        STFTP_ERROR("Failed to send %zu bytes to %s - %s",
                    size, addr.ToString().c_str(), last_error_.c_str());
        return -1;
    }
    if (static_cast<size_t>(sent) != size) {
        STFTP_WARN("Partial send: %zd bytes sent out of %zu", sent, size);
    }
    timed_out_ = false;
    return static_cast<int>(sent);
}

int SocketImpl::Receive(void* buffer, size_t buffer_size) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot receive on invalid socket");
        return -1;
    }
    if (buffer == nullptr || buffer_size == 0) {
        SetLastError("Invalid receive parameters");
        return -1;
    }

    ssize_t received;
    do {
        received = recv(socket_, buffer, buffer_size, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        SetSystemError("Failed to receive data", errno);
        STFTP_DEBUG("%s", last_error_.c_str());
        return -1;
    }
    timed_out_ = false;
    return static_cast<int>(received);
}

int SocketImpl::ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot receive on invalid socket");
        return -1;
    }
    if (buffer == nullptr || buffer_size == 0) {
        SetLastError("Invalid receive parameters");
        return -1;
    }

    sockaddr_in& sock_addr = sender_addr.GetSockAddr();
    ssize_t received;
    do {
        socklen_t addr_len = sizeof(sock_addr);
        received = recvfrom(socket_, buffer, buffer_size, 0,
                            reinterpret_cast<sockaddr*>(&sock_addr), &addr_len);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        SetSystemError("Failed to receive data", errno);
        STFTP_DEBUG("%s", last_error_.c_str());
        return -1;
    }
    timed_out_ = false;
    return static_cast<int>(received);
}

bool SocketImpl::GetLocalAddress(SocketAddress& addr) const {
    if (socket_ == kInvalidSocket) {
        last_error_ = "Invalid socket has no local address";
        return false;
    }

    sockaddr_in& sock_addr = addr.GetSockAddr();
    socklen_t addr_len = sizeof(sock_addr);
    if (getsockname(socket_, reinterpret_cast<sockaddr*>(&sock_addr), &addr_len) != 0) {
        last_error_ = std::string("Failed to get local address: ") + std::strerror(errno);
        return false;
    }
    return true;
}

void SocketImpl::Close() {
    if (socket_ != kInvalidSocket) {
        STFTP_TRACE("Closing socket (fd: %d)", socket_);
        close(socket_);
        socket_ = kInvalidSocket;
    }
}

bool SocketImpl::IsValid() const {
    return socket_ != kInvalidSocket;
}

std::string SocketImpl::GetLastError() const {
    return last_error_;
}

socket_t SocketImpl::GetNativeHandle() const {
    return socket_;
}

void SocketImpl::SetSystemError(const std::string& context, int err) {
    timed_out_ = (err == EAGAIN || err == EWOULDBLOCK);
    if (timed_out_) {
        last_error_ = context + ": timed out";
    } else {
        last_error_ = context + ": " + std::strerror(err);
    }
}

void SocketImpl::SetLastError(const std::string& error) {
    timed_out_ = false;
    last_error_ = error;
}

} // namespace internal
} // namespace net
} // namespace stftp
