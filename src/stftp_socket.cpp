#include "stftp/stftp_socket.h"
#include "internal/stftp_socket_impl.h"
#include <cstring>

namespace stftp {
namespace net {

// SocketAddress implementation
SocketAddress::SocketAddress() {
    std::memset(&addr_, 0, sizeof(addr_));
    addr_.sin_family = AF_INET;
    addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    addr_.sin_port = htons(0);
}

SocketAddress::SocketAddress(const std::string& ip, uint16_t port) : SocketAddress() {
    Set(ip, port);
}

SocketAddress::SocketAddress(const sockaddr_in& addr) : addr_(addr) {
}

std::string SocketAddress::GetIP() const {
    char ip_str[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr_.sin_addr, ip_str, INET_ADDRSTRLEN) != nullptr) {
        return std::string(ip_str);
    }
    return "0.0.0.0";
}

uint16_t SocketAddress::GetPort() const {
    return ntohs(addr_.sin_port);
}

void SocketAddress::Set(const std::string& ip, uint16_t port) {
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);

    if (ip.empty() || ip == "0.0.0.0") {
        addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) != 1) {
        // Failed to parse IP, use INADDR_ANY
        addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    }
}

SocketAddress SocketAddress::WithPort(uint16_t port) const {
    SocketAddress copy(*this);
    copy.addr_.sin_port = htons(port);
    return copy;
}

std::string SocketAddress::ToString() const {
    return GetIP() + ":" + std::to_string(GetPort());
}

bool SocketAddress::operator==(const SocketAddress& other) const {
    return addr_.sin_addr.s_addr == other.addr_.sin_addr.s_addr &&
           addr_.sin_port == other.addr_.sin_port;
}

// UdpSocket implementation
UdpSocket::UdpSocket() : impl_(std::make_unique<internal::SocketImpl>()) {
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : impl_(std::move(other.impl_)) {
    other.impl_ = std::make_unique<internal::SocketImpl>();
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        impl_ = std::move(other.impl_);
        other.impl_ = std::make_unique<internal::SocketImpl>();
    }
    return *this;
}

UdpSocket::~UdpSocket() = default;

bool UdpSocket::Create() {
    return impl_->Create();
}

bool UdpSocket::Bind(const SocketAddress& addr) {
    return impl_->Bind(addr);
}

bool UdpSocket::Connect(const SocketAddress& addr) {
    return impl_->Connect(addr);
}

bool UdpSocket::SetReuseAddress(bool reuse) {
    return impl_->SetReuseAddress(reuse);
}

bool UdpSocket::SetReadTimeout(int timeout_ms) {
    return impl_->SetTimeout(SO_RCVTIMEO, timeout_ms);
}

bool UdpSocket::SetWriteTimeout(int timeout_ms) {
    return impl_->SetTimeout(SO_SNDTIMEO, timeout_ms);
}

int UdpSocket::Send(const void* data, size_t size) {
    return impl_->Send(data, size);
}

int UdpSocket::SendTo(const void* data, size_t size, const SocketAddress& addr) {
    return impl_->SendTo(data, size, addr);
}

int UdpSocket::Receive(void* buffer, size_t buffer_size) {
    return impl_->Receive(buffer, buffer_size);
}

int UdpSocket::ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr) {
    return impl_->ReceiveFrom(buffer, buffer_size, sender_addr);
}

bool UdpSocket::GetLocalAddress(SocketAddress& addr) const {
    return impl_->GetLocalAddress(addr);
}

void UdpSocket::Close() {
    impl_->Close();
}

bool UdpSocket::IsValid() const {
    return impl_->IsValid();
}

bool UdpSocket::TimedOut() const {
    return impl_->TimedOut();
}

std::string UdpSocket::GetLastError() const {
    return impl_->GetLastError();
}

socket_t UdpSocket::GetNativeHandle() const {
    return impl_->GetNativeHandle();
}

} // namespace net
} // namespace stftp
