#pragma once

#include <framecrypt/channel.h>
#include <framecrypt/errors.h>
#include <framecrypt/protocol.h>
#include <framecrypt/stats.h>

#include <cantina/logger.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace framecrypt {

// The worker answered a request with an 'error' reply
struct worker_error : cipher_error
{
  worker_error(std::optional<protocol::ErrorCode> code, const std::string& what);

  const std::optional<protocol::ErrorCode> code;
};

// The request will never be answered: it expired, the worker's channel was
// closed, or the client went away first.
struct request_cancelled_error : cipher_error
{
  using cipher_error::cipher_error;
};

struct EncryptedFrame
{
  bytes frame;
  double encryption_time_ms = 0.0;
};

struct DecryptedFrame
{
  bytes frame;
  double decryption_time_ms = 0.0;
  bool was_encrypted = false;
  std::optional<Generation> used_generation;
};

// Host-side proxy for one CipherWorker.  Every request gets a fresh operation
// id and a future; a reply thread resolves the futures as replies arrive, in
// whatever order the worker produces them.
class CipherClient
{
public:
  struct Config
  {
    cantina::LoggerPointer logger;
    std::string name = "E2EE-CLIENT";
    size_t pending_warning_threshold = 100;
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100);
  };

  // Called on the reply thread for replies not tied to a request ('ready' at
  // worker start, periodic 'stats', errors for messages without an id).
  // Exceptions it throws are logged and do not stop the reply thread.
  using UnsolicitedHandler = std::function<void(const protocol::Outbound&)>;

  CipherClient(const Config& config,
               channel::Sender<protocol::Envelope> requests,
               channel::Receiver<protocol::Envelope> replies,
               UnsolicitedHandler on_unsolicited = {});
  ~CipherClient();

  CipherClient(const CipherClient&) = delete;
  CipherClient& operator=(const CipherClient&) = delete;

  std::future<void> init(std::optional<protocol::KeyMaterial> key = std::nullopt);
  std::future<void> update_key(protocol::KeyMaterial key);
  std::future<EncryptedFrame> encrypt(bytes&& frame);
  std::future<DecryptedFrame> decrypt(bytes&& frame);
  std::future<void> enable_encryption();
  std::future<void> disable_encryption();
  std::future<Statistics> get_stats();
  std::future<void> cleanup();

  // Rejects requests outstanding for longer than max_age; returns how many
  size_t expire(std::chrono::milliseconds max_age);
  size_t pending() const;

private:
  using Clock = std::chrono::steady_clock;

  struct Pending
  {
    Clock::time_point sent_at;
    std::function<void(protocol::Outbound&&)> resolve;
    std::function<void(std::exception_ptr)> reject;
  };

  protocol::OperationId next_id();

  template<typename Reply, typename T, typename Convert>
  std::future<T> expect(protocol::OperationId id, Convert convert);

  void send(protocol::OperationId id, protocol::Inbound&& message);
  std::optional<Pending> take(protocol::OperationId id);

  void run();
  void handle_reply(protocol::Envelope&& envelope);

  cantina::LoggerPointer logger;
  const Config config;

  channel::Sender<protocol::Envelope> requests;
  channel::Receiver<protocol::Envelope> replies;
  UnsolicitedHandler on_unsolicited;

  std::atomic<protocol::OperationId> last_id = 0;

  mutable std::mutex pending_mutex;
  std::unique_lock<std::mutex> lock() const
  {
    return std::unique_lock{ pending_mutex };
  }
  std::map<protocol::OperationId, Pending> pending_requests;

  std::atomic_bool stop_thread = false;
  std::optional<std::thread> reply_thread;
};

} // namespace framecrypt
