#include "hooktunnel/observability/factory.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/observability/log_observer.hpp"

namespace hooktunnel::observability {

namespace {

class SilentObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace

std::optional<ObserverBackend> parse_backend(const std::string &name) {
  const std::string backend = common::to_lower(common::trim(name));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return ObserverBackend::None;
  }
  if (backend == "log") {
    return ObserverBackend::Log;
  }
  return std::nullopt;
}

std::unique_ptr<IObserver> create_observer(const ObserverBackend backend) {
  if (backend == ObserverBackend::None) {
    return std::make_unique<SilentObserver>();
  }
  return std::make_unique<LogObserver>();
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto backend = parse_backend(config.observability.backend);
  if (backend.has_value()) {
    return create_observer(*backend);
  }
  auto observer = create_observer(ObserverBackend::Log);
  observer->record_event(ErrorEvent{.component = "observability",
                                    .message = "unknown backend '" + config.observability.backend +
                                               "', using log"});
  return observer;
}

} // namespace hooktunnel::observability
