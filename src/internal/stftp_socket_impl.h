/**
 * @file stftp_socket_impl.h
 * @brief POSIX implementation behind net::UdpSocket
 */

#ifndef STFTP_SOCKET_IMPL_H_
#define STFTP_SOCKET_IMPL_H_

#include "stftp/stftp_socket.h"
#include "stftp/stftp_logger.h"
#include <string>

namespace stftp {
namespace net {
namespace internal {

class SocketImpl {
public:
    SocketImpl();
    ~SocketImpl();

    // Disable copy
    SocketImpl(const SocketImpl&) = delete;
    SocketImpl& operator=(const SocketImpl&) = delete;

    bool Create();
    bool Bind(const SocketAddress& addr);
    bool Connect(const SocketAddress& addr);
    bool SetReuseAddress(bool reuse);
    bool SetTimeout(int option, int timeout_ms);
    int Send(const void* data, size_t size);
    int SendTo(const void* data, size_t size, const SocketAddress& addr);
    int Receive(void* buffer, size_t buffer_size);
    int ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr);
    bool GetLocalAddress(SocketAddress& addr) const;
    void Close();
    bool IsValid() const;
    bool TimedOut() const { return timed_out_; }
    std::string GetLastError() const;
    socket_t GetNativeHandle() const;

private:
    // Record errno of a failed call; EAGAIN after a socket timeout is flagged
    void SetSystemError(const std::string& context, int err);
    void SetLastError(const std::string& error);

    socket_t socket_;
    bool timed_out_;
    mutable std::string last_error_;
};

} // namespace internal
} // namespace net
} // namespace stftp

#endif // STFTP_SOCKET_IMPL_H_
