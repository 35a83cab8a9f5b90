#include <framecrypt/cipher_client.h>

#include <type_traits>
#include <vector>

namespace framecrypt {

worker_error::worker_error(std::optional<protocol::ErrorCode> code_in,
                           const std::string& what)
  : cipher_error(what)
  , code(code_in)
{
}

CipherClient::CipherClient(const Config& config,
                           channel::Sender<protocol::Envelope> requests,
                           channel::Receiver<protocol::Envelope> replies,
                           UnsolicitedHandler on_unsolicited)
  : logger(std::make_shared<cantina::Logger>(config.name, config.logger))
  , config(config)
  , requests(std::move(requests))
  , replies(std::move(replies))
  , on_unsolicited(std::move(on_unsolicited))
{
  reply_thread = std::thread([this]() { run(); });
}

CipherClient::~CipherClient()
{
  stop_thread = true;
  if (reply_thread && reply_thread->joinable()) {
    reply_thread->join();
  }

  auto abandoned = std::map<protocol::OperationId, Pending>{};
  {
    const auto _ = lock();
    abandoned.swap(pending_requests);
  }

  if (!abandoned.empty()) {
    LOGGER_WARNING(logger,
                   "Rejecting " << abandoned.size() << " pending requests");
  }

  for (auto& [id, entry] : abandoned) {
    entry.reject(std::make_exception_ptr(
      request_cancelled_error("Client destroyed before reply")));
  }
}

protocol::OperationId
CipherClient::next_id()
{
  return ++last_id;
}

template<typename Reply, typename T, typename Convert>
std::future<T>
CipherClient::expect(protocol::OperationId id, Convert convert)
{
  // NB: std::function requires a copyable target, hence the shared promise
  auto promise = std::make_shared<std::promise<T>>();
  auto future = promise->get_future();

  auto resolve = [promise, convert](protocol::Outbound&& reply) {
    auto* typed = std::get_if<Reply>(&reply);
    if (typed == nullptr) {
      promise->set_exception(std::make_exception_ptr(protocol::protocol_error(
        protocol::ErrorCode::invalid_message, "Unexpected reply type")));
      return;
    }

    if constexpr (std::is_void_v<T>) {
      promise->set_value();
    } else {
      promise->set_value(convert(std::move(*typed)));
    }
  };

  auto reject = [promise](std::exception_ptr error) {
    promise->set_exception(error);
  };

  auto count = size_t(0);
  {
    const auto _ = lock();
    pending_requests.insert_or_assign(
      id, Pending{ Clock::now(), std::move(resolve), std::move(reject) });
    count = pending_requests.size();
  }

  if (count == config.pending_warning_threshold + 1) {
    LOGGER_WARNING(logger,
                   "More than " << config.pending_warning_threshold
                                << " requests pending");
  }

  return future;
}

void
CipherClient::send(protocol::OperationId id, protocol::Inbound&& message)
{
  if (requests.send(protocol::encode(std::move(message)))) {
    return;
  }

  LOGGER_ERROR(logger, "Worker channel closed, request " << id << " failed");
  auto entry = take(id);
  if (entry) {
    entry->reject(std::make_exception_ptr(
      request_cancelled_error("Worker channel closed")));
  }
}

std::optional<CipherClient::Pending>
CipherClient::take(protocol::OperationId id)
{
  const auto _ = lock();
  auto it = pending_requests.find(id);
  if (it == pending_requests.end()) {
    return std::nullopt;
  }

  auto entry = std::move(it->second);
  pending_requests.erase(it);
  return entry;
}

static constexpr auto ignore_reply = [](auto&&) {};

std::future<void>
CipherClient::init(std::optional<protocol::KeyMaterial> key)
{
  const auto id = next_id();
  auto future = expect<protocol::Ready, void>(id, ignore_reply);
  send(id, protocol::Init{ id, std::move(key) });
  return future;
}

std::future<void>
CipherClient::update_key(protocol::KeyMaterial key)
{
  const auto id = next_id();
  auto future = expect<protocol::KeyUpdated, void>(id, ignore_reply);
  send(id, protocol::UpdateKey{ id, std::move(key) });
  return future;
}

std::future<EncryptedFrame>
CipherClient::encrypt(bytes&& frame)
{
  const auto id = next_id();
  auto future = expect<protocol::EncryptSuccess, EncryptedFrame>(
    id, [](protocol::EncryptSuccess&& reply) {
      return EncryptedFrame{ std::move(reply.frame), reply.encryption_time_ms };
    });
  send(id, protocol::Encrypt{ id, std::move(frame) });
  return future;
}

std::future<DecryptedFrame>
CipherClient::decrypt(bytes&& frame)
{
  const auto id = next_id();
  auto future = expect<protocol::DecryptSuccess, DecryptedFrame>(
    id, [](protocol::DecryptSuccess&& reply) {
      return DecryptedFrame{ std::move(reply.frame),
                             reply.decryption_time_ms,
                             reply.was_encrypted,
                             reply.used_generation };
    });
  send(id, protocol::Decrypt{ id, std::move(frame) });
  return future;
}

std::future<void>
CipherClient::enable_encryption()
{
  const auto id = next_id();
  auto future = expect<protocol::Ready, void>(id, ignore_reply);
  send(id, protocol::EnableEncryption{ id });
  return future;
}

std::future<void>
CipherClient::disable_encryption()
{
  const auto id = next_id();
  auto future = expect<protocol::Ready, void>(id, ignore_reply);
  send(id, protocol::DisableEncryption{ id });
  return future;
}

std::future<Statistics>
CipherClient::get_stats()
{
  const auto id = next_id();
  auto future = expect<protocol::StatsReport, Statistics>(
    id, [](protocol::StatsReport&& reply) { return reply.stats; });
  send(id, protocol::GetStats{ id });
  return future;
}

std::future<void>
CipherClient::cleanup()
{
  const auto id = next_id();
  auto future = expect<protocol::CleanupComplete, void>(id, ignore_reply);
  send(id, protocol::Cleanup{ id });
  return future;
}

size_t
CipherClient::expire(std::chrono::milliseconds max_age)
{
  const auto now = Clock::now();
  auto expired = std::vector<Pending>{};
  {
    const auto _ = lock();
    for (auto it = pending_requests.begin(); it != pending_requests.end();) {
      if (now - it->second.sent_at <= max_age) {
        ++it;
        continue;
      }

      LOGGER_WARNING(logger, "Request " << it->first << " timed out");
      expired.push_back(std::move(it->second));
      it = pending_requests.erase(it);
    }
  }

  for (auto& entry : expired) {
    entry.reject(
      std::make_exception_ptr(request_cancelled_error("Request timed out")));
  }

  return expired.size();
}

size_t
CipherClient::pending() const
{
  const auto _ = lock();
  return pending_requests.size();
}

void
CipherClient::run()
{
  while (!stop_thread) {
    auto envelope = replies.receive(config.poll_interval);
    if (envelope) {
      handle_reply(std::move(*envelope));
    } else if (!replies.is_open() && replies.is_empty()) {
      LOGGER_INFO(logger, "Reply channel closed");
      break;
    }
  }
}

void
CipherClient::handle_reply(protocol::Envelope&& envelope)
{
  const auto id_hint = protocol::peek_operation_id(envelope.header);

  auto reply = std::optional<protocol::Outbound>{};
  try {
    reply = protocol::decode_outbound(std::move(envelope));
  } catch (const protocol::protocol_error& e) {
    LOGGER_WARNING(logger, "Malformed reply: " << e.what());
    if (!id_hint) {
      return;
    }

    auto entry = take(*id_hint);
    if (entry) {
      entry->reject(std::current_exception());
    }
    return;
  }

  const auto id = protocol::operation_id(*reply);
  if (!id) {
    if (const auto* error = std::get_if<protocol::Error>(&*reply)) {
      LOGGER_WARNING(logger, "Worker error: " << error->message);
    }

    if (!on_unsolicited) {
      return;
    }

    try {
      on_unsolicited(*reply);
    } catch (const std::exception& e) {
      LOGGER_ERROR(logger, "Unsolicited reply handler failed: " << e.what());
    }
    return;
  }

  auto entry = take(*id);
  if (!entry) {
    LOGGER_WARNING(logger, "Reply for unknown operation " << *id);
    return;
  }

  if (auto* error = std::get_if<protocol::Error>(&*reply)) {
    entry->reject(
      std::make_exception_ptr(worker_error(error->code, error->message)));
    return;
  }

  entry->resolve(std::move(*reply));
}

} // namespace framecrypt
