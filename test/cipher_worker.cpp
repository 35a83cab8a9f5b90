#include <doctest/doctest.h>

#include <framecrypt/cipher_worker.h>
#include <framecrypt/key_handle.h>

#include <cantina/logger.h>

#include <thread>

using namespace framecrypt;
using namespace framecrypt::protocol;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

KeyMaterial
key_material(uint8_t fill, Generation generation)
{
  return { jwk::from_raw(bytes(KeyHandle::key_size, fill)), generation };
}

bytes
make_frame(size_t size)
{
  auto frame = bytes(size);
  for (size_t i = 0; i < size; i++) {
    frame[i] = static_cast<uint8_t>(0x80 + i);
  }
  return frame;
}

CipherWorker::Config
with_test_logger(CipherWorker::Config config)
{
  if (!config.logger) {
    config.logger =
      std::make_shared<cantina::Logger>("WorkerTest", "WORKER_TEST");
  }
  return config;
}

template<typename T>
T
expect(Outbound&& reply)
{
  REQUIRE(std::holds_alternative<T>(reply));
  return std::get<T>(std::move(reply));
}

class WorkerHarness
{
public:
  explicit WorkerHarness(const CipherWorker::Config& config = {},
                         size_t reply_capacity = 64)
    : request_channel(channel::create<Envelope>(64))
    , reply_channel(channel::create<Envelope>(reply_capacity))
    , worker(with_test_logger(config),
             std::get<1>(request_channel),
             std::get<0>(reply_channel))
  {
  }

  // Synchronous round trip on the calling thread
  Outbound call(Inbound&& message)
  {
    return call_raw(encode(std::move(message)));
  }

  Outbound call_raw(Envelope&& envelope)
  {
    worker.dispatch(std::move(envelope));
    return take_reply();
  }

  Outbound take_reply()
  {
    auto reply = replies().try_receive();
    REQUIRE(reply);
    REQUIRE(replies().is_empty());
    return decode_outbound(std::move(*reply));
  }

  // For a running worker
  void send(Inbound&& message)
  {
    REQUIRE(requests().send(encode(std::move(message))));
  }

  Outbound wait_reply()
  {
    auto reply = replies().receive(2s);
    REQUIRE(reply);
    return decode_outbound(std::move(*reply));
  }

  void enable_with_key(const KeyMaterial& key)
  {
    expect<Ready>(call(Init{ 1, key }));
    expect<Ready>(call(EnableEncryption{ 2 }));
  }

  const channel::Sender<Envelope>& requests() const
  {
    return std::get<0>(request_channel);
  }

  const channel::Receiver<Envelope>& replies() const
  {
    return std::get<1>(reply_channel);
  }

  std::tuple<channel::Sender<Envelope>, channel::Receiver<Envelope>>
    request_channel;
  std::tuple<channel::Sender<Envelope>, channel::Receiver<Envelope>>
    reply_channel;
  CipherWorker worker;
};

} // namespace

TEST_CASE("Malformed messages are answered and the worker keeps serving")
{
  auto harness = WorkerHarness();

  const auto unknown = expect<Error>(harness.call_raw(
    { json{ { "type", "explode" }, { "operationId", 5 } }, std::nullopt }));
  REQUIRE(unknown.operation_id == 5);
  REQUIRE(unknown.code == ErrorCode::unknown_message_type);

  const auto not_object =
    expect<Error>(harness.call_raw({ json::array(), std::nullopt }));
  REQUIRE(not_object.operation_id == std::nullopt);
  REQUIRE(not_object.code == ErrorCode::invalid_message);

  const auto no_frame = expect<Error>(harness.call_raw(
    { json{ { "type", "encrypt" }, { "operationId", 6 } }, std::nullopt }));
  REQUIRE(no_frame.operation_id == 6);
  REQUIRE(no_frame.code == ErrorCode::invalid_message);

  const auto stats = expect<StatsReport>(harness.call(GetStats{ 7 }));
  REQUIRE(stats.operation_id == 7);
  REQUIRE(stats.stats == Statistics{});
}

TEST_CASE("Bad key material is rejected without touching the state")
{
  auto harness = WorkerHarness();

  auto bad = key_material(0x01, 1);
  bad.encryption_key["kty"] = "EC";

  const auto error = expect<Error>(harness.call(UpdateKey{ 3, bad }));
  REQUIRE(error.operation_id == 3);
  REQUIRE(error.code == ErrorCode::key_import_failed);
  REQUIRE_FALSE(harness.worker.state().current_key);

  expect<Ready>(harness.call(Init{ 4, key_material(0x01, 1) }));
  bad.generation = 2;
  const auto second = expect<Error>(harness.call(Init{ 5, bad }));
  REQUIRE(second.code == ErrorCode::key_import_failed);
  REQUIRE(harness.worker.state().current_key->generation == 1);
}

TEST_CASE("Encryption passes frames through until it is enabled with a key")
{
  auto harness = WorkerHarness();
  const auto frame = make_frame(100);

  SUBCASE("Disabled")
  {
    expect<Ready>(harness.call(Init{ 1, key_material(0x01, 1) }));
  }

  SUBCASE("Enabled without a key")
  {
    expect<Ready>(harness.call(EnableEncryption{ 1 }));
  }

  const auto reply =
    expect<EncryptSuccess>(harness.call(Encrypt{ 10, bytes(frame) }));
  REQUIRE(reply.operation_id == 10);
  REQUIRE(reply.frame == frame);

  const auto& stats = harness.worker.state().stats;
  REQUIRE(stats.total_frames == 1);
  REQUIRE(stats.passthrough_frames == 1);
  REQUIRE(stats.encrypted_frames == 0);
}

TEST_CASE("Frames encrypted by one worker decrypt in another")
{
  auto sender = WorkerHarness();
  auto receiver = WorkerHarness();
  const auto key = key_material(0x33, 1);
  sender.enable_with_key(key);
  receiver.enable_with_key(key);

  const auto frame = make_frame(500);
  auto encrypted =
    expect<EncryptSuccess>(sender.call(Encrypt{ 11, bytes(frame) }));
  REQUIRE(encrypted.frame != frame);
  REQUIRE(encrypted.frame[0] == 1);
  REQUIRE(encrypted.encryption_time_ms >= 0.0);

  const auto decrypted = expect<DecryptSuccess>(
    receiver.call(Decrypt{ 12, std::move(encrypted.frame) }));
  REQUIRE(decrypted.operation_id == 12);
  REQUIRE(decrypted.frame == frame);
  REQUIRE(decrypted.was_encrypted);
  REQUIRE(decrypted.used_generation == 1);

  REQUIRE(sender.worker.state().stats.encrypted_frames == 1);
  REQUIRE(receiver.worker.state().stats.decrypted_frames == 1);
  REQUIRE(receiver.worker.state().stats.key_generation == 1);
  REQUIRE(receiver.worker.state().stats.encryption_enabled);
}

TEST_CASE("Decryption ignores the encryption flag")
{
  auto sender = WorkerHarness();
  auto receiver = WorkerHarness();
  sender.enable_with_key(key_material(0x33, 1));
  expect<Ready>(receiver.call(Init{ 1, key_material(0x33, 1) }));

  auto encrypted =
    expect<EncryptSuccess>(sender.call(Encrypt{ 1, make_frame(64) }));
  const auto decrypted = expect<DecryptSuccess>(
    receiver.call(Decrypt{ 2, std::move(encrypted.frame) }));
  REQUIRE(decrypted.was_encrypted);
  REQUIRE(decrypted.frame == make_frame(64));
}

TEST_CASE("Repeating a key update for the current generation does not rotate")
{
  auto harness = WorkerHarness();
  expect<Ready>(harness.call(Init{ 1, key_material(0x01, 1) }));

  expect<KeyUpdated>(harness.call(UpdateKey{ 2, key_material(0x02, 2) }));
  const auto replay = expect<KeyUpdated>(
    harness.call(UpdateKey{ 3, key_material(0x02, 2) }));
  REQUIRE(replay.operation_id == 3);

  const auto& state = harness.worker.state();
  REQUIRE(state.current_key->generation == 2);
  REQUIRE(state.previous_key->generation == 1);
}

TEST_CASE("Rotation keeps in-flight frames decryptable")
{
  auto sender = WorkerHarness();
  auto receiver = WorkerHarness();
  sender.enable_with_key(key_material(0x01, 1));
  receiver.enable_with_key(key_material(0x01, 1));

  auto in_flight =
    expect<EncryptSuccess>(sender.call(Encrypt{ 3, make_frame(80) }));

  expect<KeyUpdated>(sender.call(UpdateKey{ 4, key_material(0x02, 2) }));
  expect<KeyUpdated>(receiver.call(UpdateKey{ 4, key_material(0x02, 2) }));

  auto fresh = expect<EncryptSuccess>(sender.call(Encrypt{ 5, make_frame(90) }));
  REQUIRE(fresh.frame[0] == 2);

  const auto old_frame = expect<DecryptSuccess>(
    receiver.call(Decrypt{ 6, std::move(in_flight.frame) }));
  REQUIRE(old_frame.used_generation == 1);
  REQUIRE(old_frame.frame == make_frame(80));

  const auto new_frame =
    expect<DecryptSuccess>(receiver.call(Decrypt{ 7, std::move(fresh.frame) }));
  REQUIRE(new_frame.used_generation == 2);
  REQUIRE(new_frame.frame == make_frame(90));
}

TEST_CASE("Rotation across the generation wrap keeps generation 255 usable")
{
  auto sender = WorkerHarness();
  auto receiver = WorkerHarness();
  sender.enable_with_key(key_material(0x0f, 255));
  receiver.enable_with_key(key_material(0x0f, 255));

  auto in_flight =
    expect<EncryptSuccess>(sender.call(Encrypt{ 3, make_frame(80) }));
  REQUIRE(in_flight.frame[0] == 255);

  expect<KeyUpdated>(sender.call(UpdateKey{ 4, key_material(0x10, 0) }));
  expect<KeyUpdated>(receiver.call(UpdateKey{ 4, key_material(0x10, 0) }));

  const auto& state = receiver.worker.state();
  REQUIRE(state.current_key->generation == 0);
  REQUIRE(state.previous_key->generation == 255);

  const auto old_frame = expect<DecryptSuccess>(
    receiver.call(Decrypt{ 5, std::move(in_flight.frame) }));
  REQUIRE(old_frame.was_encrypted);
  REQUIRE(old_frame.used_generation == 255);
  REQUIRE(old_frame.frame == make_frame(80));

  auto fresh = expect<EncryptSuccess>(sender.call(Encrypt{ 6, make_frame(90) }));
  REQUIRE(fresh.frame[0] == 0);
  const auto new_frame =
    expect<DecryptSuccess>(receiver.call(Decrypt{ 7, std::move(fresh.frame) }));
  REQUIRE(new_frame.used_generation == 0);

  // Two ahead of the current generation: near enough to be a real frame, but
  // no key is held for it
  auto ahead = bytes(64, 0xa5);
  ahead[0] = 2;
  const auto error =
    expect<Error>(receiver.call(Decrypt{ 8, std::move(ahead) }));
  REQUIRE(error.operation_id == 8);
  REQUIRE(error.code == ErrorCode::generation_unrecoverable);
}

TEST_CASE("Decryption failures are reported and counted")
{
  auto sender = WorkerHarness();
  auto receiver = WorkerHarness();
  sender.enable_with_key(key_material(0x01, 1));

  SUBCASE("Tampered frame")
  {
    receiver.enable_with_key(key_material(0x01, 1));
    auto encrypted =
      expect<EncryptSuccess>(sender.call(Encrypt{ 1, make_frame(64) }));
    encrypted.frame[20] ^= 0x04;

    const auto error = expect<Error>(
      receiver.call(Decrypt{ 2, std::move(encrypted.frame) }));
    REQUIRE(error.operation_id == 2);
    REQUIRE(error.code == ErrorCode::authentication_failed);
  }

  SUBCASE("Retired generation")
  {
    receiver.enable_with_key(key_material(0x03, 3));
    expect<KeyUpdated>(receiver.call(UpdateKey{ 3, key_material(0x04, 4) }));

    auto encrypted =
      expect<EncryptSuccess>(sender.call(Encrypt{ 1, make_frame(64) }));
    const auto error = expect<Error>(
      receiver.call(Decrypt{ 2, std::move(encrypted.frame) }));
    REQUIRE(error.code == ErrorCode::generation_unrecoverable);
  }

  const auto& stats = receiver.worker.state().stats;
  REQUIRE(stats.total_frames == 1);
  REQUIRE(stats.decryption_errors == 1);
  REQUIRE(stats.dropped_frames == 1);
  REQUIRE(stats.decrypted_frames == 0);
}

TEST_CASE("Cleanup releases keys and resets statistics")
{
  auto sender = WorkerHarness();
  auto receiver = WorkerHarness();
  const auto key = key_material(0x07, 1);
  sender.enable_with_key(key);
  receiver.enable_with_key(key);

  auto encrypted =
    expect<EncryptSuccess>(sender.call(Encrypt{ 3, make_frame(64) }));
  const auto copy = encrypted.frame;
  expect<DecryptSuccess>(receiver.call(Decrypt{ 4, bytes(copy) }));

  const auto done = expect<CleanupComplete>(receiver.call(Cleanup{ 5 }));
  REQUIRE(done.operation_id == 5);

  const auto& state = receiver.worker.state();
  REQUIRE_FALSE(state.current_key);
  REQUIRE_FALSE(state.previous_key);
  REQUIRE_FALSE(state.encryption_enabled);
  REQUIRE(state.stats == Statistics{});

  // With no key the same ciphertext now passes through untouched
  const auto after = expect<DecryptSuccess>(receiver.call(Decrypt{ 6, bytes(copy) }));
  REQUIRE_FALSE(after.was_encrypted);
  REQUIRE(after.frame == copy);
}

TEST_CASE("Running worker announces itself and serves its channel")
{
  auto harness = WorkerHarness();
  harness.worker.start();
  REQUIRE(harness.worker.running());

  const auto ready = expect<Ready>(harness.wait_reply());
  REQUIRE(ready.operation_id == std::nullopt);

  harness.send(GetStats{ 42 });
  const auto stats = expect<StatsReport>(harness.wait_reply());
  REQUIRE(stats.operation_id == 42);

  harness.worker.stop();
  REQUIRE_FALSE(harness.worker.running());
}

TEST_CASE("Statistics are reported periodically while encryption is enabled")
{
  auto harness = WorkerHarness({ .stats_interval = 20ms, .poll_interval = 5ms });
  harness.worker.start();
  expect<Ready>(harness.wait_reply());

  harness.send(EnableEncryption{ 1 });
  expect<Ready>(harness.wait_reply());

  harness.send(Encrypt{ 2, make_frame(40) });
  expect<EncryptSuccess>(harness.wait_reply());

  const auto report = expect<StatsReport>(harness.wait_reply());
  REQUIRE(report.operation_id == std::nullopt);
  REQUIRE(report.stats.total_frames == 1);
  REQUIRE(report.stats.passthrough_frames == 1);
}

TEST_CASE("Stopping does not wait for a reply nobody collects")
{
  // Room for the start-up announcement only
  auto harness = WorkerHarness({ .poll_interval = 5ms }, 1);
  harness.worker.start();

  harness.send(GetStats{ 1 });
  harness.send(GetStats{ 2 });
  std::this_thread::sleep_for(20ms);

  harness.worker.stop();
  REQUIRE_FALSE(harness.worker.running());

  REQUIRE(harness.replies().size() == 1);
  expect<Ready>(harness.wait_reply());
}

TEST_CASE("Worker stops running once its inbound channel is closed")
{
  auto harness = WorkerHarness({ .poll_interval = 5ms });
  harness.worker.start();
  expect<Ready>(harness.wait_reply());

  harness.send(GetStats{ 1 });
  harness.requests().close();

  // Messages queued before the close are still answered
  const auto stats = expect<StatsReport>(harness.wait_reply());
  REQUIRE(stats.operation_id == 1);

  for (auto i = 0; i < 200 && harness.worker.running(); i++) {
    std::this_thread::sleep_for(5ms);
  }
  REQUIRE_FALSE(harness.worker.running());

  harness.worker.stop();
}
