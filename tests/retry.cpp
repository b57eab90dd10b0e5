#include "lfsync/error.hpp"
#include "lfsync/release_store.hpp"

#include <chrono>
#include <iostream>
#include <vector>

using namespace std::chrono_literals;

int main() {
  std::vector<std::chrono::seconds> slept;
  const lfsync::StoreRetry policy(3, [&](std::chrono::seconds d) { slept.push_back(d); });

  // Two transient failures, then success.
  int calls = 0;
  const int got = policy.run("flaky", [&] {
    if (++calls < 3)
      throw lfsync::StoreError("upstream 502", 502);
    return 7;
  });
  if (got != 7 || calls != 3) {
    std::cerr << "expected success on the third attempt\n";
    return 1;
  }
  if (slept != std::vector<std::chrono::seconds>{1s, 2s}) {
    std::cerr << "expected backoff of 1s then 2s\n";
    return 1;
  }

  // Client errors are not retried.
  slept.clear();
  calls = 0;
  try {
    policy.run("forbidden", [&]() -> int {
      ++calls;
      throw lfsync::StoreError("forbidden", 403);
    });
    std::cerr << "403 should propagate\n";
    return 1;
  } catch (const lfsync::StoreError &e) {
    if (e.status() != 403 || calls != 1 || !slept.empty()) {
      std::cerr << "4xx must fail on the first attempt without sleeping\n";
      return 1;
    }
  }

  // Transport errors exhaust the attempts and surface the last error.
  slept.clear();
  calls = 0;
  try {
    policy.run("offline", [&]() -> int {
      ++calls;
      throw lfsync::StoreError("connection refused", 0);
    });
    std::cerr << "exhausted retries should propagate\n";
    return 1;
  } catch (const lfsync::StoreError &e) {
    if (!e.transient() || calls != 3 || slept.size() != 2) {
      std::cerr << "expected 3 attempts with 2 sleeps\n";
      return 1;
    }
  }

  // Non-store exceptions pass straight through.
  calls = 0;
  try {
    policy.run("bug", [&]() -> int {
      ++calls;
      throw std::logic_error("bug");
    });
    return 1;
  } catch (const std::logic_error &) {
    if (calls != 1) {
      std::cerr << "unrelated exceptions must not be retried\n";
      return 1;
    }
  }
  return 0;
}
