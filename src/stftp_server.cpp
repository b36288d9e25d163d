#include "stftp/stftp_server.h"
#include "stftp/stftp_validation.h"
#include "stftp/stftp_logger.h"
#include "internal/stftp_server_impl.h"

namespace stftp {

TftpServer::TftpServer(const std::string& root_dir, uint16_t port)
    : impl_(nullptr) {
    if (!validation::ValidateRootDirectory(root_dir)) {
        throw StftpException("Invalid root directory: " + root_dir);
    }

    if (!validation::ValidatePort(port)) {
        throw StftpException("Invalid port number: " + std::to_string(port));
    }

    impl_ = std::make_unique<internal::TftpServerImpl>(root_dir, port);
}

TftpServer::~TftpServer() = default;

bool TftpServer::Start() {
    return impl_->Start();
}

void TftpServer::Stop() {
    impl_->Stop();
}

bool TftpServer::IsRunning() const {
    return impl_->IsRunning();
}

void TftpServer::SetSecureMode(bool secure) {
    if (!secure) {
        STFTP_WARN("Secure mode disabled: requests may leave the root directory");
    }
    impl_->SetSecureMode(secure);
}

void TftpServer::SetTimeout(int seconds) {
    if (!validation::ValidateTimeout(seconds)) {
        throw StftpException("Invalid timeout value: " + std::to_string(seconds));
    }
    impl_->SetTimeout(seconds);
}

void TftpServer::SetWorkerThreads(size_t count) {
    if (!validation::ValidateWorkerThreads(count)) {
        throw StftpException("Invalid worker thread count: " + std::to_string(count));
    }
    impl_->SetWorkerThreads(count);
}

void TftpServer::SetMaxBlockSize(uint16_t block_size) {
    if (!validation::ValidateBlockSize(block_size)) {
        throw StftpException("Invalid block size: " + std::to_string(block_size));
    }
    impl_->SetMaxBlockSize(block_size);
}

void TftpServer::SetTransferCallback(TransferCallback callback) {
    impl_->SetTransferCallback(std::move(callback));
}

} // namespace stftp
