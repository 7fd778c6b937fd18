#pragma once

#include "codebox/config/schema.hpp"
#include "codebox/observability/observer.hpp"

#include <memory>

namespace codebox::observability {

/// Maps observability.backend to an observer. "none"/"noop" and an empty value
/// give a NoopObserver, "log" a LogObserver on stderr. A comma list builds a
/// MultiObserver, skipping repeats and unknown names; a list that resolves to
/// one backend returns that backend directly. Unknown single values fall back
/// to "log".
[[nodiscard]] std::unique_ptr<IObserver>
create_observer(const config::ObservabilityConfig &config);

} // namespace codebox::observability
