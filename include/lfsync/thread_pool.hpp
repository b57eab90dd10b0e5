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
#include <vector>

namespace lfsync {

// Fixed-size worker pool; the destructor drains queued tasks, then joins.
class ThreadPool {
public:
  explicit ThreadPool(std::size_t threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  auto operator=(const ThreadPool &) -> ThreadPool & = delete;

  // Exceptions thrown by `f` surface from the returned future's get().
  template <class F> auto submit(F &&f) -> std::future<std::invoke_result_t<F>>;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_{false};
};

template <class F> auto ThreadPool::submit(F &&f) -> std::future<std::invoke_result_t<F>> {
  using R = std::invoke_result_t<F>;
  auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
  auto res = task->get_future();
  {
    const std::lock_guard<std::mutex> lk(mu_);
    if (stop_)
      throw std::runtime_error("submit on stopped ThreadPool");
    tasks_.emplace([task]() { (*task)(); });
  }
  cv_.notify_one();
  return res;
}

} // namespace lfsync
