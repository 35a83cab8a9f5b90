#pragma once

#include <framecrypt/channel.h>
#include <framecrypt/cipher_state.h>
#include <framecrypt/frame_codec.h>
#include <framecrypt/protocol.h>

#include <cantina/logger.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace framecrypt {

// The isolated cipher context.  One worker serves one media direction of one
// track: it owns a CipherState nobody else can see, takes envelopes off its
// inbound channel one at a time and posts exactly one reply per message.
class CipherWorker
{
public:
  struct Config
  {
    cantina::LoggerPointer logger;
    std::string name = "E2EE";
    TagPolicy tag_policy = DefaultTagLength{};

    // Unsolicited statistics while encryption is enabled; zero disables
    std::chrono::milliseconds stats_interval = std::chrono::seconds(5);

    // How long the loop waits for a message before checking for shutdown
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100);
  };

  CipherWorker(const Config& config,
               channel::Receiver<protocol::Envelope> inbound,
               channel::Sender<protocol::Envelope> outbound);
  ~CipherWorker();

  CipherWorker(const CipherWorker&) = delete;
  CipherWorker& operator=(const CipherWorker&) = delete;

  // Starts the dispatch thread, which first announces itself with 'ready'
  void start();
  void stop();

  // False once the loop has ended, whether stopped or because the inbound
  // channel was closed and drained
  bool running() const;

  // Processes one envelope on the calling thread.  The dispatch thread calls
  // this for every message it receives; it never throws.
  void dispatch(protocol::Envelope&& envelope);

  // Only meaningful while the dispatch thread is not running
  const CipherState& state() const { return _state; }

private:
  void run();
  void maybe_report_stats();
  bool install_key(const protocol::KeyMaterial& material);

  void handle(protocol::Init&& msg);
  void handle(protocol::UpdateKey&& msg);
  void handle(protocol::Encrypt&& msg);
  void handle(protocol::Decrypt&& msg);
  void handle(protocol::EnableEncryption&& msg);
  void handle(protocol::DisableEncryption&& msg);
  void handle(protocol::GetStats&& msg);
  void handle(protocol::Cleanup&& msg);

  void post(protocol::Outbound&& reply);
  void post_error(std::optional<protocol::OperationId> operation_id,
                  const std::string& message,
                  std::optional<protocol::ErrorCode> code);

  cantina::LoggerPointer logger;
  const Config config;
  const FrameCodec codec;

  channel::Receiver<protocol::Envelope> inbound;
  channel::Sender<protocol::Envelope> outbound;

  CipherState _state;

  using Clock = std::chrono::steady_clock;
  Clock::time_point last_stats_report;
  uint64_t decrypt_requests = 0;

  static constexpr uint64_t decrypt_log_interval = 100;

  std::atomic_bool stop_thread = false;
  std::atomic_bool dispatching = false;
  std::optional<std::thread> dispatch_thread;
};

} // namespace framecrypt
