#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace webpool {

namespace detail {

template <typename T>
struct ChannelState {
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<T> queue;
  std::size_t senders{0};
  bool receiver_alive{true};
};

}  // namespace detail

template <typename T>
class Receiver;

// Producer end of an unbounded FIFO channel. Copies are additional
// producers; the channel disconnects when the last one is destroyed.
template <typename T>
class Sender {
 public:
  Sender(const Sender& other) : state_(other.state_) {
    if (state_) {
      std::lock_guard<std::mutex> lock(state_->mtx);
      ++state_->senders;
    }
  }

  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

  Sender& operator=(Sender other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~Sender() { release(); }

  // Never blocks. Returns false (and drops the value) once the receiver is gone.
  bool send(T value) {
    if (!state_) return false;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      if (!state_->receiver_alive) return false;
      state_->queue.push_back(std::move(value));
    }
    state_->cv.notify_one();
    return true;
  }

 private:
  template <typename U>
  friend std::pair<Sender<U>, Receiver<U>> make_channel();

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    std::lock_guard<std::mutex> lock(state_->mtx);
    ++state_->senders;
  }

  void release() {
    if (!state_) return;
    bool last = false;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      last = (--state_->senders == 0);
    }
    if (last) state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

// Consumer end. Not thread-safe to share without external locking.
template <typename T>
class Receiver {
 public:
  Receiver(Receiver&&) noexcept = default;
  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  ~Receiver() { close(); }

  // Blocks until a value is available. Returns std::nullopt once every
  // sender is gone and the queue is empty.
  std::optional<T> recv() {
    std::unique_lock<std::mutex> lock(state_->mtx);
    state_->cv.wait(lock, [this] {
      return !state_->queue.empty() || state_->senders == 0;
    });
    return pop_locked();
  }

 private:
  template <typename U>
  friend std::pair<Sender<U>, Receiver<U>> make_channel();

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  std::optional<T> pop_locked() {
    if (state_->queue.empty()) return std::nullopt;
    std::optional<T> value(std::move(state_->queue.front()));
    state_->queue.pop_front();
    return value;
  }

  void close() {
    if (!state_) return;
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      state_->receiver_alive = false;
      dropped.swap(state_->queue);
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
  auto state = std::make_shared<detail::ChannelState<T>>();
  return {Sender<T>(state), Receiver<T>(state)};
}

}  // namespace webpool
