/**
 * @file stftp_server.h
 * @brief Read-only TFTP server: request listener and dispatching facade
 */

#ifndef STFTP_SERVER_H_
#define STFTP_SERVER_H_

#include "stftp/stftp_common.h"
#include "stftp/stftp_byte_source.h"
#include "stftp/stftp_packet_socket.h"
#include "stftp/stftp_transfer.h"
#include <functional>
#include <memory>
#include <string>

namespace stftp {

// Forward declaration
namespace internal {
class TftpServerImpl;
}

/**
 * @class RequestListener
 * @brief Well-known endpoint that accepts requests and spawns transfers
 */
class STFTP_EXPORT RequestListener {
public:
    RequestListener();

    RequestListener(const RequestListener&) = delete;
    RequestListener& operator=(const RequestListener&) = delete;

    /**
     * @brief Bind the listening socket
     * @param address Address to listen on, usually port 69
     * @return true if successful
     */
    bool Bind(const net::SocketAddress& address);

    /**
     * @brief Socket timeouts of the listening socket itself
     * @param timeout_ms Timeout in milliseconds, 0 blocks forever
     */
    bool SetReadTimeout(int timeout_ms);
    bool SetWriteTimeout(int timeout_ms);

    /**
     * @brief Socket timeouts given to every transfer created afterwards
     * @param read_ms Receive timeout in milliseconds, 0 blocks forever
     * @param write_ms Send timeout in milliseconds, 0 blocks forever
     */
    void SetTransferTimeouts(int read_ms, int write_ms);

    /**
     * @brief Wait for the next request
     *
     * A datagram that decodes to anything but RRQ or WRQ is reported as
     * kMalformed.
     *
     * @param request Out: the request packet
     * @param sender Out: address of the requesting client
     * @return kOk, kTimeout, kIoError or kMalformed
     */
    ReceiveStatus ReceiveRequest(Packet& request, net::SocketAddress& sender);

    /**
     * @brief Send an ERROR packet to a client
     */
    bool SendErrorTo(ErrorCode code, const std::string& message, const net::SocketAddress& target);

    /**
     * @brief Create a transfer of `source` to `target`
     *
     * The transfer socket is bound to an ephemeral port on the listener's IP
     * and connected to `target`.
     *
     * @return The transfer, or nullptr on socket failure (see GetLastError)
     */
    std::unique_ptr<Transfer> CreateTransferTo(const net::SocketAddress& target,
                                               std::unique_ptr<ByteSource> source,
                                               const AckOptions& options);

    bool GetLocalAddress(net::SocketAddress& addr) const;
    void Close() { socket_.Close(); }
    std::string GetLastError() const { return last_error_; }

private:
    TftpSocket socket_;
    int transfer_read_timeout_ms_;
    int transfer_write_timeout_ms_;
    std::string last_error_;
};

/**
 * @class TftpServer
 * @brief Serves the files of a root directory over TFTP (read requests only)
 *
 * The dispatch loop runs on its own thread; each accepted read request is
 * served by a Transfer on a worker pool.
 */
class STFTP_EXPORT TftpServer {
 public:
  using TransferCallback = std::function<void(const std::string& filename,
                                              const net::SocketAddress& client,
                                              const TransferResult& result)>;

  /**
   * @brief Constructor
   * @param root_dir Directory to serve, must exist
   * @param port Port number (default 69)
   * @throws StftpException on invalid root directory or port
   */
  TftpServer(const std::string& root_dir, uint16_t port = kDefaultTftpPort);

  ~TftpServer();

  /**
   * @brief Bind the port and start the dispatch loop
   * @return true if the server is running
   */
  bool Start();

  /**
   * @brief Stop the dispatch loop and wait for running transfers
   */
  void Stop();

  bool IsRunning() const;

  /**
   * @brief Confine requests to the root directory (default on)
   */
  void SetSecureMode(bool secure);

  /**
   * @brief Socket timeout of every transfer, in seconds (default 5)
   * @throws StftpException outside 1..3600; takes effect on Start
   */
  void SetTimeout(int seconds);

  /**
   * @brief Number of transfers served concurrently
   * @throws StftpException outside 1..256; takes effect on Start
   */
  void SetWorkerThreads(size_t count);

  /**
   * @brief Largest block size acknowledged to clients (default 65464)
   * @throws StftpException outside 8..65464
   */
  void SetMaxBlockSize(uint16_t block_size);

  /**
   * @brief Called on a worker thread after every finished transfer
   */
  void SetTransferCallback(TransferCallback callback);

 private:
  std::unique_ptr<internal::TftpServerImpl> impl_;
};

} // namespace stftp

#endif // STFTP_SERVER_H_
