#pragma once

// ============================================================================
// Binding Builder — the one place CC numbers meet effect parameters.
// ============================================================================

#include "app_config.hpp"
#include "../core/cc_binding.hpp"

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace psiwave {

class CcRouter;
class ParameterSink;

// Effect name -> live sink.
using BindingTargets = QHash<QString, ParameterSink *>;

// Negative numbers (unbound) pass through; anything above 127 becomes 127.
int clamp_cc(int control);

// Whether the wave-speed binding is built for this sync mode.
bool wave_speed_binding_enabled(WaveSpeedMapping mapping, SyncMode sync);

// The stock bindings built from the --cc-* options.
QVector<CcBindingSpec> default_binding_specs(const AppConfig &config);

// Resolve `spec` against `targets`. nullopt (with `error`) for an unknown
// target or a spec that does not validate.
std::optional<CcBinding> make_binding(const CcBindingSpec &spec,
									  const BindingTargets &targets,
									  QString *error = nullptr);

// Add every buildable spec to `router`; the rest go to `warnings`.
// Returns the number of bindings added.
int build_bindings(const QVector<CcBindingSpec> &specs,
				   const BindingTargets &targets, CcRouter &router,
				   QStringList *warnings = nullptr);

} // namespace psiwave
