#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "absl/synchronization/mutex.h"

namespace kubetls {
namespace util {

// Computes a value on first Get() and returns the same instance afterwards.
// Concurrent first callers block until the single load finishes. A loader
// that throws leaves the cell empty, so the next Get() retries.
template <typename T>
class LazyValue {
 public:
  using Loader = std::function<T()>;

  explicit LazyValue(Loader loader) : loader_(std::move(loader)) {}

  LazyValue(const LazyValue&)            = delete;
  LazyValue& operator=(const LazyValue&) = delete;

  std::shared_ptr<const T> Get() {
    absl::MutexLock lock(&mu_);
    if (!value_)
      value_ = std::make_shared<const T>(loader_());
    return value_;
  }

 private:
  Loader loader_;
  absl::Mutex mu_;
  std::shared_ptr<const T> value_ ABSL_GUARDED_BY(mu_);
};

}  // namespace util
}  // namespace kubetls
