#include "pairlink/observability/factory.hpp"

#include "pairlink/common/fs.hpp"
#include "pairlink/observability/log_observer.hpp"
#include "pairlink/observability/noop_observer.hpp"

namespace pairlink::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace pairlink::observability
