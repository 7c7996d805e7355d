#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace lsim {

// Fixed-size worker pool. submit() wraps the callable in a packaged_task and
// hands back its future.
//
// The destructor does not join: a worker may be stuck in a call that never
// returns (a hung policy backend). Queued tasks are dropped, so their futures
// report broken_promise, and every worker is detached. Workers share ownership
// of the queue state and exit as soon as their current call returns.
class ThreadPool {
public:
  explicit ThreadPool(std::size_t threads) : shared_(std::make_shared<Shared>()) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([s = shared_]() {
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lk(s->mu);
            s->cv.wait(lk, [&]() { return s->stop || !s->tasks.empty(); });
            if (s->stop) return;
            task = std::move(s->tasks.front());
            s->tasks.pop();
            ++s->busy;
          }
          task();
          std::lock_guard<std::mutex> lk(s->mu);
          --s->busy;
        }
      });
    }
  }

  ~ThreadPool() {
    {
      std::lock_guard<std::mutex> lk(shared_->mu);
      shared_->stop = true;
      std::queue<std::function<void()>>().swap(shared_->tasks);
    }
    shared_->cv.notify_all();
    for (auto& t : workers_) t.detach();
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <class F>
  auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;

    auto pkg = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = pkg->get_future();
    {
      std::lock_guard<std::mutex> lk(shared_->mu);
      if (shared_->stop) throw std::runtime_error("thread pool is stopping");
      shared_->tasks.emplace([pkg]() { (*pkg)(); });
    }
    shared_->cv.notify_one();
    return fut;
  }

  std::size_t size() const noexcept { return workers_.size(); }

  // Workers currently inside a task.
  std::size_t busy() const {
    std::lock_guard<std::mutex> lk(shared_->mu);
    return shared_->busy;
  }

private:
  struct Shared {
    std::mutex mu;
    std::condition_variable cv;
    std::queue<std::function<void()>> tasks;
    std::size_t busy{0};
    bool stop{false};
  };

  std::shared_ptr<Shared> shared_;
  std::vector<std::thread> workers_;
};

} // namespace lsim
