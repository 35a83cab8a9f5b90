#include <framecrypt/channel.h>
#include <framecrypt/cipher_client.h>
#include <framecrypt/cipher_worker.h>
#include <framecrypt/key_handle.h>
#include <framecrypt/random.h>

#include <cantina/logger.h>
#include <mbedtls/platform_util.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace framecrypt;

static constexpr size_t channel_capacity = 64;

// A worker together with the client that drives it
struct Endpoint
{
  Endpoint(const cantina::LoggerPointer& logger, const std::string& name)
  {
    auto [to_worker, worker_inbound] =
      channel::create<protocol::Envelope>(channel_capacity);
    auto [worker_outbound, from_worker] =
      channel::create<protocol::Envelope>(channel_capacity);

    worker = std::make_unique<CipherWorker>(
      CipherWorker::Config{ .logger = logger, .name = name },
      std::move(worker_inbound),
      std::move(worker_outbound));

    client = std::make_unique<CipherClient>(
      CipherClient::Config{ .logger = logger, .name = name + "-CLIENT" },
      std::move(to_worker),
      std::move(from_worker),
      [logger, name](const protocol::Outbound& reply) {
        if (const auto* stats = std::get_if<protocol::StatsReport>(&reply)) {
          LOGGER_INFO(logger,
                      name << " stats: " << nlohmann::json(stats->stats).dump());
        }
      });

    worker->start();
  }

  ~Endpoint()
  {
    worker->stop();
    client.reset();
  }

  std::unique_ptr<CipherWorker> worker;
  std::unique_ptr<CipherClient> client;
};

static protocol::KeyMaterial
make_key(RandomSource& random, Generation generation)
{
  auto raw = bytes(KeyHandle::key_size);
  random.fill(raw);
  auto material = protocol::KeyMaterial{ jwk::from_raw(raw), generation };
  mbedtls_platform_zeroize(raw.data(), raw.size());
  return material;
}

static bytes
make_frame(size_t index, size_t size)
{
  auto frame = bytes(size);
  for (size_t i = 0; i < size; i++) {
    frame[i] = static_cast<uint8_t>((index + i) & 0xff);
  }
  return frame;
}

static void
usage(const char* argv0)
{
  std::cerr << "Usage: " << argv0 << " [frames] [rotate-every] [frame-size]"
            << std::endl;
}

int
main(int argc, char** argv)
{
  auto frames = size_t(1000);
  auto rotate_every = size_t(100);
  auto frame_size = size_t(1200);

  try {
    if (argc > 1) {
      frames = std::stoul(argv[1]);
    }
    if (argc > 2) {
      rotate_every = std::stoul(argv[2]);
    }
    if (argc > 3) {
      frame_size = std::stoul(argv[3]);
    }
  } catch (const std::exception&) {
    usage(argv[0]);
    return 1;
  }

  if (argc > 4 || rotate_every == 0) {
    usage(argv[0]);
    return 1;
  }

  const auto logger = std::make_shared<cantina::Logger>(std::string("LOOP"));

  try {
    auto random = RandomSource();
    auto sender = Endpoint(logger, "SEND");
    auto receiver = Endpoint(logger, "RECV");

    auto generation = Generation(1);
    auto key = make_key(random, generation);
    sender.client->init(key).get();
    receiver.client->init(key).get();
    sender.client->enable_encryption().get();
    receiver.client->enable_encryption().get();

    auto mismatches = size_t(0);
    auto failures = size_t(0);
    for (size_t i = 0; i < frames; i++) {
      const auto plaintext = make_frame(i, frame_size);
      auto encrypted = sender.client->encrypt(bytes(plaintext)).get();

      // Rotate while this frame is still in flight, so that the receiver has
      // to fall back to the previous generation to open it.
      if (i > 0 && i % rotate_every == 0) {
        generation += 1;
        auto next = make_key(random, generation);
        sender.client->update_key(next).get();
        receiver.client->update_key(next).get();
        LOGGER_INFO(logger, "Rotated to generation " << generation);
      }

      try {
        const auto decrypted =
          receiver.client->decrypt(std::move(encrypted.frame)).get();
        if (decrypted.frame != plaintext) {
          mismatches += 1;
        }
      } catch (const worker_error& e) {
        LOGGER_WARNING(logger, "Frame " << i << " dropped: " << e.what());
        failures += 1;
      }
    }

    auto report = nlohmann::json::object();
    report["sender"] = sender.client->get_stats().get();
    report["receiver"] = receiver.client->get_stats().get();
    report["mismatches"] = mismatches;
    report["failures"] = failures;
    std::cout << report.dump(2) << std::endl;

    sender.client->cleanup().get();
    receiver.client->cleanup().get();

    return (mismatches == 0 && failures == 0) ? 0 : 1;
  } catch (const std::exception& e) {
    LOGGER_ERROR(logger, "Loopback failed: " << e.what());
    return 1;
  }
}
