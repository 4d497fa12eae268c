#include "opgate/observability/factory.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/observability/log_observer.hpp"
#include "opgate/observability/noop_observer.hpp"

namespace opgate::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace opgate::observability
