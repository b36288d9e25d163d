/**
 * @file stftp_server_impl.h
 * @brief TFTP server implementation class
 */

#ifndef STFTP_SERVER_IMPL_H_
#define STFTP_SERVER_IMPL_H_

#include "stftp/stftp_common.h"
#include "stftp/stftp_server.h"
#include "internal/stftp_thread_pool.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

namespace stftp {
namespace internal {

class TftpServerImpl {
public:
    TftpServerImpl(const std::string& root_dir, uint16_t port);
    ~TftpServerImpl();

    bool Start();
    void Stop();
    bool IsRunning() const;

    void SetSecureMode(bool secure);
    void SetTimeout(int seconds);
    void SetWorkerThreads(size_t count);
    void SetMaxBlockSize(uint16_t block_size);
    void SetTransferCallback(TftpServer::TransferCallback callback);

private:
    void ServerLoop();
    void HandleRequest(const Packet& request, const net::SocketAddress& client);
    void HandleReadRequest(const Packet& request, const net::SocketAddress& client);
    void RunTransfer(const std::shared_ptr<Transfer>& transfer, const std::string& filename,
                     const net::SocketAddress& client);
    void SendError(ErrorCode code, const std::string& message, const net::SocketAddress& client);

    std::string root_dir_;
    uint16_t port_;
    std::atomic<bool> running_;
    std::thread server_thread_;
    std::unique_ptr<RequestListener> listener_;
    std::unique_ptr<ThreadPool> thread_pool_;

    // Settings, read by the dispatch loop and the workers
    mutable std::shared_mutex config_mutex_;
    bool secure_mode_;
    int timeout_seconds_;
    size_t worker_threads_;
    uint16_t max_block_size_;
    TftpServer::TransferCallback transfer_callback_;
};

} // namespace internal
} // namespace stftp

#endif // STFTP_SERVER_IMPL_H_
