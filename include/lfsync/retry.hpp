#pragma once
#include "lfsync/consts.hpp"
#include "lfsync/log.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <thread>
#include <type_traits>

namespace lfsync {

/**
 * Bounded retry with exponential backoff (2^attempt seconds between
 * attempts: 1s, 2s, ...). Which failures are worth retrying is decided by
 * the Classify functor, called with the caught exception:
 *
 *   RetryPolicy<StoreTransient> policy;
 *   auto body = policy.run("GET releases", [&] { return client.get(url); });
 *
 * Non-retryable errors, and the last retryable one, propagate unchanged.
 */
template <typename Error, typename Classify> class RetryPolicy {
public:
  using Sleep = std::function<void(std::chrono::seconds)>;

  explicit RetryPolicy(int max_attempts = consts::kMaxAttempts, Sleep sleep = {},
                       Classify classify = {})
      : max_attempts_{max_attempts < 1 ? 1 : max_attempts},
        sleep_{sleep ? std::move(sleep)
                     : Sleep([](std::chrono::seconds d) { std::this_thread::sleep_for(d); })},
        classify_{std::move(classify)} {}

  [[nodiscard]] auto max_attempts() const noexcept -> int { return max_attempts_; }

  static auto backoff(int attempt) -> std::chrono::seconds {
    return std::chrono::seconds(1LL << attempt);
  }

  template <typename Fn> auto run(const char *what, Fn &&fn) const -> std::invoke_result_t<Fn &> {
    for (int attempt = 0;; ++attempt) {
      try {
        return fn();
      } catch (const Error &e) {
        if (!classify_(e) || attempt + 1 >= max_attempts_)
          throw;
        const auto delay = backoff(attempt);
        LOGW("%s failed (attempt %d/%d): %s; retrying in %llds", what, attempt + 1,
             max_attempts_, e.what(), static_cast<long long>(delay.count()));
        sleep_(delay);
      }
    }
  }

private:
  int max_attempts_;
  Sleep sleep_;
  Classify classify_;
};

} // namespace lfsync
