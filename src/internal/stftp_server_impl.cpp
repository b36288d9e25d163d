#include "internal/stftp_server_impl.h"
#include "stftp/stftp_logger.h"
#include "stftp/stftp_util.h"
#include "stftp/stftp_validation.h"
#include <filesystem>

namespace stftp {
namespace internal {

// The dispatch loop wakes up this often to check for Stop()
constexpr int kPollIntervalMs = 200;

TftpServerImpl::TftpServerImpl(const std::string& root_dir, uint16_t port)
    : root_dir_(root_dir),
      port_(port),
      running_(false),
      secure_mode_(true),
      timeout_seconds_(kDefaultTimeout),
      worker_threads_(std::thread::hardware_concurrency()),
      max_block_size_(kMaxBlockSize) {
}

TftpServerImpl::~TftpServerImpl() {
    Stop();
}

bool TftpServerImpl::Start() {
    if (running_) {
        STFTP_INFO("TFTP server is already running");
        return true;
    }

    int timeout_ms;
    size_t workers;
    {
        std::shared_lock<std::shared_mutex> lock(config_mutex_);
        timeout_ms = timeout_seconds_ * 1000;
        workers = worker_threads_;
    }

    auto listener = std::make_unique<RequestListener>();
    if (!listener->Bind(net::SocketAddress("0.0.0.0", port_)) ||
        !listener->SetReadTimeout(kPollIntervalMs)) {
        STFTP_ERROR("Cannot listen on port %u: %s", port_, listener->GetLastError().c_str());
        return false;
    }
    listener->SetTransferTimeouts(timeout_ms, timeout_ms);

    listener_ = std::move(listener);
    thread_pool_ = std::make_unique<ThreadPool>(workers);

    running_ = true;
    server_thread_ = std::thread(&TftpServerImpl::ServerLoop, this);
    STFTP_INFO("TFTP server started on port %u serving %s with %zu worker threads",
               port_, root_dir_.c_str(), thread_pool_->GetThreadCount());
    return true;
}

void TftpServerImpl::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    // Running transfers finish, or fail on their socket timeout
    if (thread_pool_) {
        thread_pool_->Shutdown();
        thread_pool_.reset();
    }

    listener_.reset();
    STFTP_INFO("TFTP server stopped");
}

bool TftpServerImpl::IsRunning() const {
    return running_ && server_thread_.joinable();
}

void TftpServerImpl::SetSecureMode(bool secure) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    secure_mode_ = secure;
}

void TftpServerImpl::SetTimeout(int seconds) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    timeout_seconds_ = seconds;
}

void TftpServerImpl::SetWorkerThreads(size_t count) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    worker_threads_ = count;
}

void TftpServerImpl::SetMaxBlockSize(uint16_t block_size) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    max_block_size_ = block_size;
}

void TftpServerImpl::SetTransferCallback(TftpServer::TransferCallback callback) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    transfer_callback_ = std::move(callback);
}

void TftpServerImpl::ServerLoop() {
    while (running_) {
        Packet request;
        net::SocketAddress client;
        ReceiveStatus status = listener_->ReceiveRequest(request, client);

        switch (status) {
            case ReceiveStatus::kOk:
                HandleRequest(request, client);
                break;
            case ReceiveStatus::kTimeout:
                break;
            case ReceiveStatus::kMalformed:
                STFTP_INFO("[%s] Rejected datagram: %s",
                           client.ToString().c_str(), listener_->GetLastError().c_str());
                SendError(ErrorCode::kIllegalOperation, "Illegal TFTP operation", client);
                break;
            case ReceiveStatus::kIoError:
                STFTP_ERROR("Receive on port %u failed: %s", port_, listener_->GetLastError().c_str());
                break;
        }
    }
}

void TftpServerImpl::HandleRequest(const Packet& request, const net::SocketAddress& client) {
    if (request.IsWriteRequest()) {
        STFTP_INFO("[%s] Write request for %s refused",
                   client.ToString().c_str(), request.GetFilename().c_str());
        SendError(ErrorCode::kIllegalOperation, "write requests are not supported", client);
        return;
    }
    HandleReadRequest(request, client);
}

void TftpServerImpl::HandleReadRequest(const Packet& request, const net::SocketAddress& client) {
    std::string filename = util::StripLeadingSlashes(request.GetFilename());
    STFTP_INFO("[%s] Read request for %s", client.ToString().c_str(), filename.c_str());

    bool secure_mode;
    uint16_t max_block_size;
    {
        std::shared_lock<std::shared_mutex> lock(config_mutex_);
        secure_mode = secure_mode_;
        max_block_size = max_block_size_;
    }

    if (!validation::ValidateFilename(filename) ||
        (secure_mode && !util::IsPathSecure(filename, root_dir_))) {
        SendError(ErrorCode::kAccessViolation, "Access denied", client);
        return;
    }

    std::string path = util::NormalizePath((std::filesystem::path(root_dir_) / filename).string());
    auto source = std::make_unique<FileByteSource>();
    if (path.empty()) {
        SendError(ErrorCode::kFileNotFound, "File not found", client);
        return;
    }
    if (!source->Open(path)) {
        STFTP_INFO("[%s] %s", client.ToString().c_str(), source->GetLastError().c_str());
        SendError(ErrorCode::kFileNotFound, "File not found", client);
        return;
    }

    AckOptions options = NegotiateOptions(request.GetRequestOptions(), source->Size(), max_block_size);
    std::shared_ptr<Transfer> transfer = listener_->CreateTransferTo(client, std::move(source), options);
    if (!transfer) {
        SendError(ErrorCode::kNotDefined, "Cannot start transfer", client);
        return;
    }

    try {
        // The future is not kept: RunTransfer reports through the log and the callback
        thread_pool_->Submit([this, transfer, filename, client]() {
            RunTransfer(transfer, filename, client);
        });
    } catch (const std::runtime_error& e) {
        STFTP_WARN("[%s] Dropping transfer of %s: %s",
                   client.ToString().c_str(), filename.c_str(), e.what());
    }
}

void TftpServerImpl::RunTransfer(const std::shared_ptr<Transfer>& transfer,
                                 const std::string& filename,
                                 const net::SocketAddress& client) {
    TransferResult result = transfer->Finish();
    if (result.Ok()) {
        STFTP_INFO("[%s] Sent %s (%llu bytes)", client.ToString().c_str(), filename.c_str(),
                   static_cast<unsigned long long>(result.bytes_sent));
    } else {
        STFTP_WARN("[%s] Transfer of %s failed: %s: %s", client.ToString().c_str(),
                   filename.c_str(), TransferStatusToString(result.status), result.message.c_str());
    }

    TftpServer::TransferCallback callback;
    {
        std::shared_lock<std::shared_mutex> lock(config_mutex_);
        callback = transfer_callback_;
    }
    if (callback) {
        try {
            callback(filename, client, result);
        } catch (const std::exception& e) {
            STFTP_ERROR("[%s] Transfer callback threw: %s", client.ToString().c_str(), e.what());
        }
    }
}

void TftpServerImpl::SendError(ErrorCode code, const std::string& message,
                               const net::SocketAddress& client) {
    if (!listener_->SendErrorTo(code, message, client)) {
        STFTP_WARN("[%s] Could not send error reply: %s",
                   client.ToString().c_str(), listener_->GetLastError().c_str());
    }
}

} // namespace internal
} // namespace stftp
