#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>

namespace framecrypt::channel {

// A bounded, closable queue that hands values off by move.  Closing the
// channel wakes every waiter; receivers may still drain whatever was queued
// before the close, senders fail immediately.
template<typename T>
struct Channel
{
  explicit Channel(size_t capacity)
    : _capacity(capacity)
  {
  }

  std::optional<T> receive()
  {
    auto lock = std::unique_lock<std::mutex>(_mutex);
    _cv.wait(lock, [this] { return !_data.empty() || !_open; });
    return pop_front();
  }

  std::optional<T> receive(std::chrono::milliseconds wait_time)
  {
    auto lock = std::unique_lock<std::mutex>(_mutex);
    _cv.wait_for(
      lock, wait_time, [this] { return !_data.empty() || !_open; });
    return pop_front();
  }

  std::optional<T> try_receive()
  {
    const auto _ = std::lock_guard<std::mutex>(_mutex);
    return pop_front();
  }

  bool send(T&& val)
  {
    auto lock = std::unique_lock<std::mutex>(_mutex);
    _cv.wait(lock, [this] { return !_open || _data.size() < _capacity; });
    return push_back(std::move(val));
  }

  bool send(T&& val, std::chrono::milliseconds wait_time)
  {
    auto lock = std::unique_lock<std::mutex>(_mutex);
    _cv.wait_for(
      lock, wait_time, [this] { return !_open || _data.size() < _capacity; });
    return push_back(std::move(val));
  }

  void close()
  {
    const auto _ = std::lock_guard<std::mutex>(_mutex);
    _open = false;
    _cv.notify_all();
  }

  // Helper functions
  bool is_open() const
  {
    const auto _ = std::lock_guard<std::mutex>(_mutex);
    return _open;
  }

  bool is_empty() const
  {
    const auto _ = std::lock_guard<std::mutex>(_mutex);
    return _data.empty();
  }

  size_t size() const
  {
    const auto _ = std::lock_guard<std::mutex>(_mutex);
    return _data.size();
  }

  size_t capacity() const { return _capacity; }

protected:
  // NOTE: caller must hold the mutex
  std::optional<T> pop_front()
  {
    if (_data.empty()) {
      return std::nullopt;
    }

    auto val = std::optional<T>(std::move(_data.front()));
    _data.pop_front();
    _cv.notify_all();
    return val;
  }

  // NOTE: caller must hold the mutex
  bool push_back(T&& val)
  {
    if (!_open || _data.size() >= _capacity) {
      return false;
    }

    _data.emplace_back(std::move(val));
    _cv.notify_all();
    return true;
  }

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<T> _data;
  const size_t _capacity;
  bool _open = true;
};

template<typename T>
struct Sender;

template<typename T>
struct Receiver;

template<typename T>
struct ChannelView
{
  explicit ChannelView(size_t capacity)
    : channel(std::make_shared<Channel<T>>(capacity))
  {
  }

  ChannelView(std::shared_ptr<Channel<T>> channel_in)
    : channel(std::move(channel_in))
  {
  }

  Sender<T> make_sender() const { return { channel }; }
  Receiver<T> make_receiver() const { return { channel }; }

  void close() const { channel->close(); }
  bool is_open() const { return channel->is_open(); }
  bool is_empty() const { return channel->is_empty(); }
  size_t capacity() const { return channel->capacity(); }
  size_t size() const { return channel->size(); }

protected:
  std::shared_ptr<Channel<T>> channel;
};

template<typename T>
struct Sender : ChannelView<T>
{
  using parent = ChannelView<T>;
  using parent::channel;
  using parent::parent;

  bool send(T&& val) const { return channel->send(std::move(val)); }
  bool send(T&& val, std::chrono::milliseconds wait_time) const
  {
    return channel->send(std::move(val), wait_time);
  }
};

template<typename T>
struct Receiver : ChannelView<T>
{
  using parent = ChannelView<T>;
  using parent::channel;
  using parent::parent;

  std::optional<T> receive() const { return channel->receive(); }
  std::optional<T> receive(std::chrono::milliseconds wait_time) const
  {
    return channel->receive(wait_time);
  }
  std::optional<T> try_receive() const { return channel->try_receive(); }
};

template<typename T>
std::tuple<Sender<T>, Receiver<T>>
create(size_t capacity)
{
  auto chan = std::make_shared<Channel<T>>(capacity);
  return { Sender<T>(chan), Receiver<T>(chan) };
}

} // namespace framecrypt::channel
