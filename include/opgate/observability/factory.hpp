#pragma once

#include "opgate/config/schema.hpp"
#include "opgate/observability/observer.hpp"

#include <memory>

namespace opgate::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace opgate::observability
