#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "concepts.hpp"
#include "stop_token.hpp"

namespace again::execution {

// ============================================================================
// timer_loop - single-threaded event loop with deadline ordered work
// ============================================================================
//
// Work is queued either as ready (schedule()) or with a deadline (schedule_at / schedule_after)
// and completes on the thread that calls run(). Items with equal deadlines complete in the order
// they were queued. A timer whose receiver observes a stop request is moved to the front of the
// queue and completes with set_stopped() on the loop thread. Once finish() is called, run()
// completes everything still queued with set_stopped() and returns; later submissions complete
// with set_stopped() immediately.
class timer_loop {
 public:
  using clock      = std::chrono::steady_clock;
  using time_point = clock::time_point;
  using duration   = clock::duration;

  timer_loop() = default;

  ~timer_loop() {
    finish();
  }

  timer_loop(const timer_loop&)                    = delete;
  auto operator=(const timer_loop&) -> timer_loop& = delete;

 private:
  struct _item {
    using position_t = std::multimap<time_point, _item*>::iterator;

    time_point                deadline_;
    std::optional<position_t> position_;
    bool                      cancelled_ = false;

    explicit _item(time_point deadline) noexcept : deadline_(deadline) {}

    virtual void complete(bool stopped) noexcept = 0;

   protected:
    ~_item() = default;
  };

  template <class Rcvr>
  class _operation final : private _item {
   public:
    using operation_state_concept = operation_state_t;

    _operation(timer_loop* loop, time_point deadline, Rcvr r)
        : _item(deadline), loop_(loop), receiver_(std::move(r)) {}

    _operation(const _operation&)                    = delete;
    auto operator=(const _operation&) -> _operation& = delete;

    void start() & noexcept {
      auto token = get_stop_token(get_env(receiver_));
      if (token.stop_requested()) {
        std::move(receiver_).set_stopped();
        return;
      }
      // Registered before queueing so the loop thread never races the registration
      on_stop_.emplace(std::move(token), _on_stop{this});
      if (!loop_->enqueue(this)) {
        on_stop_.reset();
        std::move(receiver_).set_stopped();
      }
    }

   private:
    struct _on_stop {
      _operation* self_;

      void operator()() const noexcept {
        self_->loop_->cancel(self_);
      }
    };

    using stop_token_t    = stop_token_of_t<env_of_t<Rcvr>>;
    using stop_callback_t = stop_callback_for_t<stop_token_t, _on_stop>;

    void complete(bool stopped) noexcept override {
      on_stop_.reset();
      if (stopped) {
        std::move(receiver_).set_stopped();
      } else {
        std::move(receiver_).set_value();
      }
    }

    timer_loop*                    loop_;
    Rcvr                           receiver_;
    std::optional<stop_callback_t> on_stop_;
  };

  struct _schedule_sender {
    using sender_concept = sender_t;
    using value_types    = type_list<>;

    timer_loop* loop_;
    time_point  deadline_;

    template <class Env>
    auto get_completion_signatures(Env&& /*unused*/) const noexcept {
      return completion_signatures<set_value_t(), set_stopped_t()>{};
    }

    template <receiver R>
    auto connect(R&& r) const {
      return _operation<__decay_t<R>>(loop_, deadline_, std::forward<R>(r));
    }
  };

 public:
  class timer_scheduler {
   public:
    using scheduler_concept = scheduler_t;

    explicit timer_scheduler(timer_loop* loop) noexcept : loop_(loop) {}

    [[nodiscard]] auto schedule() const noexcept -> _schedule_sender {
      return _schedule_sender{loop_, time_point::min()};
    }

    [[nodiscard]] auto schedule_at(time_point deadline) const noexcept -> _schedule_sender {
      return _schedule_sender{loop_, deadline};
    }

    [[nodiscard]] auto schedule_after(duration d) const noexcept -> _schedule_sender {
      return _schedule_sender{loop_, now() + d};
    }

    [[nodiscard]] static auto now() noexcept -> time_point {
      return clock::now();
    }

    auto operator==(const timer_scheduler& other) const noexcept -> bool {
      return loop_ == other.loop_;
    }

   private:
    timer_loop* loop_;
  };

  auto get_scheduler() noexcept -> timer_scheduler {
    return timer_scheduler{this};
  }

  // Processes queued work on the calling thread until finish() is called
  void run() {
    std::unique_lock lock(mutex_);
    while (!stop_) {
      if (items_.empty()) {
        cv_.wait(lock);
        continue;
      }
      auto first = items_.begin();
      if (first->first > clock::now()) {
        cv_.wait_until(lock, first->first);
        continue;
      }
      _item* item = pop(first);
      bool   stopped = item->cancelled_;
      lock.unlock();
      item->complete(stopped);
      lock.lock();
    }
    while (!items_.empty()) {
      _item* item = pop(items_.begin());
      lock.unlock();
      item->complete(true);
      lock.lock();
    }
  }

  void finish() {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] auto pending() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return items_.size();
  }

 private:
  auto enqueue(_item* item) -> bool {
    {
      std::scoped_lock lock(mutex_);
      if (stop_) {
        return false;
      }
      auto key        = item->cancelled_ ? time_point::min() : item->deadline_;
      item->position_ = items_.emplace(key, item);
    }
    cv_.notify_one();
    return true;
  }

  void cancel(_item* item) noexcept {
    {
      std::scoped_lock lock(mutex_);
      item->cancelled_ = true;
      if (!item->position_) {
        return;
      }
      items_.erase(*item->position_);
      item->position_ = items_.emplace(time_point::min(), item);
    }
    cv_.notify_one();
  }

  auto pop(std::multimap<time_point, _item*>::iterator it) -> _item* {
    _item* item = it->second;
    items_.erase(it);
    item->position_.reset();
    return item;
  }

  std::multimap<time_point, _item*> items_;
  mutable std::mutex                mutex_;
  std::condition_variable           cv_;
  bool                              stop_ = false;
};

}  // namespace again::execution
