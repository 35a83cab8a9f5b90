#include <framecrypt/cipher_worker.h>
#include <framecrypt/errors.h>

namespace framecrypt {

using Clock = std::chrono::steady_clock;

static double
elapsed_ms(Clock::time_point start)
{
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

static std::string
describe_keys(const CipherState& state)
{
  auto out = std::string("hasKey=") + (state.current_key ? "true" : "false");
  if (state.current_key) {
    out += ", gen=" + std::to_string(state.current_key->generation);
  }
  if (state.previous_key) {
    out += ", prevGen=" + std::to_string(state.previous_key->generation);
  }
  return out;
}

CipherWorker::CipherWorker(const Config& config,
                           channel::Receiver<protocol::Envelope> inbound,
                           channel::Sender<protocol::Envelope> outbound)
  : logger(std::make_shared<cantina::Logger>(config.name, config.logger))
  , config(config)
  , codec(config.tag_policy)
  , inbound(std::move(inbound))
  , outbound(std::move(outbound))
  , last_stats_report(Clock::now())
{
}

CipherWorker::~CipherWorker()
{
  stop();
}

void
CipherWorker::start()
{
  if (dispatch_thread) {
    return;
  }

  stop_thread = false;
  dispatching = true;
  dispatch_thread = std::thread([this]() { run(); });
}

void
CipherWorker::stop()
{
  stop_thread = true;

  if (dispatch_thread && dispatch_thread->joinable()) {
    LOGGER_DEBUG(logger, "Stopping dispatch thread");
    dispatch_thread->join();
    LOGGER_DEBUG(logger, "Dispatch thread stopped");
  }

  dispatch_thread.reset();
}

bool
CipherWorker::running() const
{
  return dispatching;
}

void
CipherWorker::run()
{
  LOGGER_INFO(logger, "Cipher worker ready");
  post(protocol::Ready{});

  while (!stop_thread) {
    auto envelope = inbound.receive(config.poll_interval);
    if (envelope) {
      dispatch(std::move(*envelope));
    } else if (!inbound.is_open() && inbound.is_empty()) {
      LOGGER_INFO(logger, "Inbound channel closed");
      break;
    }

    maybe_report_stats();
  }

  dispatching = false;
}

void
CipherWorker::dispatch(protocol::Envelope&& envelope)
{
  const auto operation_id = protocol::peek_operation_id(envelope.header);

  try {
    auto message = protocol::decode_inbound(std::move(envelope));
    std::visit([this](auto&& msg) { handle(std::move(msg)); },
               std::move(message));
  } catch (const protocol::protocol_error& e) {
    LOGGER_WARNING(logger, "Rejected message: " << e.what());
    post_error(operation_id, e.what(), e.code);
  } catch (const key_import_error& e) {
    LOGGER_ERROR(logger, "Key import failed: " << e.what());
    post_error(operation_id, e.what(), protocol::ErrorCode::key_import_failed);
  } catch (const std::exception& e) {
    LOGGER_ERROR(logger, "Failed to handle message: " << e.what());
    post_error(operation_id, e.what(), std::nullopt);
  }
}

bool
CipherWorker::install_key(const protocol::KeyMaterial& material)
{
  // Re-installing the current generation would leave both slots holding the
  // same generation and lose the key in-flight frames still need.
  if (_state.current_key &&
      _state.current_key->generation == material.generation) {
    LOGGER_DEBUG(logger,
                 "Ignoring duplicate key update for gen=" << material.generation);
    return false;
  }

  auto key = KeyHandle::import_jwk(material.encryption_key);
  _state = update_key(_state, std::move(key), material.generation);

  LOGGER_INFO(logger, "Key updated: " << describe_keys(_state));
  return true;
}

void
CipherWorker::handle(protocol::Init&& msg)
{
  if (msg.key) {
    install_key(*msg.key);
  }

  post(protocol::Ready{ msg.operation_id });
}

void
CipherWorker::handle(protocol::UpdateKey&& msg)
{
  install_key(msg.key);
  post(protocol::KeyUpdated{ msg.operation_id });
}

void
CipherWorker::handle(protocol::Encrypt&& msg)
{
  const auto start = Clock::now();

  if (!_state.encryption_enabled || !_state.current_key) {
    _state = with_stats(_state, record_passthrough(_state.stats));
    post(protocol::EncryptSuccess{
      msg.operation_id, std::move(msg.frame), elapsed_ms(start) });
    return;
  }

  try {
    const auto& entry = *_state.current_key;
    auto frame = codec.encrypt(*entry.key, entry.generation, msg.frame);

    const auto elapsed = elapsed_ms(start);
    _state = with_stats(_state, record_encryption(_state.stats, elapsed));
    post(protocol::EncryptSuccess{ msg.operation_id, std::move(frame), elapsed });
  } catch (const cipher_error& e) {
    _state = with_stats(_state, record_encryption_error(_state.stats));
    LOGGER_ERROR(logger,
                 "Encryption failed, dropping frame " << msg.operation_id << ": "
                                                      << e.what());
    post_error(
      msg.operation_id, e.what(), protocol::ErrorCode::encryption_failed);
  }
}

void
CipherWorker::handle(protocol::Decrypt&& msg)
{
  const auto start = Clock::now();

  decrypt_requests += 1;
  if (decrypt_requests % decrypt_log_interval == 1) {
    LOGGER_DEBUG(logger,
                 "Decrypt frame #" << decrypt_requests << ": "
                                   << describe_keys(_state)
                                   << ", frameSize=" << msg.frame.size()
                                   << ", dec=" << _state.stats.decrypted_frames
                                   << ", drop=" << _state.stats.dropped_frames);
  }

  auto code = protocol::ErrorCode::decryption_failed;
  auto reason = std::string{};

  try {
    auto result = codec.decrypt(_state, std::move(msg.frame));

    const auto elapsed = elapsed_ms(start);
    auto stats = result.was_encrypted
                   ? record_decryption(_state.stats, elapsed)
                   : record_passthrough(_state.stats);
    _state = with_stats(_state, std::move(stats));

    post(protocol::DecryptSuccess{ msg.operation_id,
                                   std::move(result.data),
                                   elapsed,
                                   result.was_encrypted,
                                   result.used_generation });
    return;
  } catch (const generation_unrecoverable_error& e) {
    code = protocol::ErrorCode::generation_unrecoverable;
    reason = e.what();
  } catch (const authentication_error& e) {
    code = protocol::ErrorCode::authentication_failed;
    reason = e.what();
  } catch (const cipher_error& e) {
    reason = e.what();
  }

  _state = with_stats(_state, record_decryption_error(_state.stats));
  LOGGER_WARNING(logger,
                 "Decryption failed, dropping frame " << msg.operation_id
                                                      << ": " << reason);
  post_error(msg.operation_id, reason, code);
}

void
CipherWorker::handle(protocol::EnableEncryption&& msg)
{
  _state = with_encryption_enabled(_state, true);
  last_stats_report = Clock::now();

  LOGGER_INFO(logger, "Encryption enabled (" << describe_keys(_state) << ")");
  post(protocol::Ready{ msg.operation_id });
}

void
CipherWorker::handle(protocol::DisableEncryption&& msg)
{
  _state = with_encryption_enabled(_state, false);

  LOGGER_INFO(logger, "Encryption disabled");
  post(protocol::Ready{ msg.operation_id });
}

void
CipherWorker::handle(protocol::GetStats&& msg)
{
  post(protocol::StatsReport{ msg.operation_id, _state.stats });
}

void
CipherWorker::handle(protocol::Cleanup&& msg)
{
  // Dropping the entries releases the key handles, which zeroize themselves
  _state = CipherState{};
  decrypt_requests = 0;

  LOGGER_INFO(logger, "Cleaned up key material");
  post(protocol::CleanupComplete{ msg.operation_id });
}

void
CipherWorker::maybe_report_stats()
{
  if (config.stats_interval.count() == 0 || !_state.encryption_enabled ||
      _state.stats.total_frames == 0) {
    return;
  }

  const auto now = Clock::now();
  if (now - last_stats_report < config.stats_interval) {
    return;
  }

  last_stats_report = now;
  post(protocol::StatsReport{ std::nullopt, _state.stats });
}

void
CipherWorker::post(protocol::Outbound&& reply)
{
  // A failed send leaves the envelope with us, so it can be retried
  auto envelope = protocol::encode(std::move(reply));
  while (outbound.is_open()) {
    if (outbound.send(std::move(envelope), config.poll_interval)) {
      return;
    }

    if (stop_thread) {
      LOGGER_WARNING(logger, "Stopping with reply undelivered, dropping it");
      return;
    }
  }

  LOGGER_WARNING(logger, "Reply channel closed, dropping reply");
}

void
CipherWorker::post_error(std::optional<protocol::OperationId> operation_id,
                         const std::string& message,
                         std::optional<protocol::ErrorCode> code)
{
  post(protocol::Error{ operation_id, message, code });
}

} // namespace framecrypt
