#pragma once

#include "hooktunnel/config/schema.hpp"
#include "hooktunnel/observability/observer.hpp"

#include <memory>
#include <optional>
#include <string>

namespace hooktunnel::observability {

enum class ObserverBackend { None, Log };

/// Accepts "none"/"noop"/"" and "log", case-insensitively.
[[nodiscard]] std::optional<ObserverBackend> parse_backend(const std::string &name);

[[nodiscard]] std::unique_ptr<IObserver> create_observer(ObserverBackend backend);

// Unknown backend names fall back to the log observer, which reports the bad value.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hooktunnel::observability
