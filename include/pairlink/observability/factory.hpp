#pragma once

#include "pairlink/config/schema.hpp"
#include "pairlink/observability/observer.hpp"

#include <memory>

namespace pairlink::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace pairlink::observability
