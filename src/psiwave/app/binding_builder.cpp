#include "binding_builder.hpp"

#include "../io/cc_router.hpp"

#include <QJsonObject>

#include <algorithm>

namespace psiwave {

namespace {

constexpr double kTwoPi = 6.283185307179586;

QJsonObject linear(double low, double high)
{
	QJsonObject o;
	o["kind"] = QStringLiteral("linear");
	o["low"] = low;
	o["high"] = high;
	return o;
}

QJsonObject raw()
{
	QJsonObject o;
	o["kind"] = QStringLiteral("raw");
	return o;
}

QJsonObject sigmoid(double low, double high, double threshold, double steepness)
{
	QJsonObject o;
	o["kind"] = QStringLiteral("sigmoid");
	o["low"] = low;
	o["high"] = high;
	o["threshold"] = threshold;
	o["steepness"] = steepness;
	return o;
}

void add_spec(QVector<CcBindingSpec> &out, int control, const char *target,
			  const char *param, const QJsonObject &transform)
{
	control = clamp_cc(control);
	if (control < 0)
		return;

	CcBindingSpec s;
	s.controls = {control};
	s.target = QString::fromLatin1(target);
	s.param = QString::fromLatin1(param);
	s.transform = transform;
	out.append(s);
}

} // namespace

int clamp_cc(int control)
{
	return std::min(control, kMaxControlValue);
}

bool wave_speed_binding_enabled(WaveSpeedMapping mapping, SyncMode sync)
{
	switch (mapping) {
	case WaveSpeedMapping::On:	return true;
	case WaveSpeedMapping::Off:	return false;
	case WaveSpeedMapping::Auto:
		return sync != SyncMode::Speed && sync != SyncMode::Both;
	}
	return false;
}

QVector<CcBindingSpec> default_binding_specs(const AppConfig &c)
{
	QVector<CcBindingSpec> specs;

	if (wave_speed_binding_enabled(c.wave_speed_mapping, c.sync.mode))
		add_spec(specs, c.cc_wave_speed, "sinwave", "speed", linear(0.0, 2.0));
	add_spec(specs, c.cc_wave_wavelength, "sinwave", "wavelength", linear(1.0, 0.25));
	add_spec(specs, c.cc_wave_color, "sinwave", "color", raw());
	add_spec(specs, c.cc_wave_phase, "sinwave", "phase_offset", linear(0.0, kTwoPi));

	add_spec(specs, c.cc_starfield_speed, "starfield", "speed", linear(0.5, 4.0));
	add_spec(specs, c.cc_starfield_color, "starfield", "color_amount",
		sigmoid(0.0, 1.0, clamp01(c.starfield_color_threshold),
			c.starfield_color_steepness));

	add_spec(specs, c.cc_text_speed, "text_scroll", "speed", linear(0.5, 2.0));
	add_spec(specs, c.cc_text_color, "text_scroll", "color", raw());

	return specs;
}

std::optional<CcBinding> make_binding(const CcBindingSpec &spec,
									  const BindingTargets &targets,
									  QString *error)
{
	QString why;
	if (!spec.validate(&why)) {
		if (error)
			*error = why;
		return std::nullopt;
	}

	ParameterSink *sink = targets.value(spec.target, nullptr);
	if (!sink) {
		if (error)
			*error = QStringLiteral("unknown target '%1'").arg(spec.target);
		return std::nullopt;
	}

	// validate() has already checked both of these.
	ControlTransformPtr transform = transform_from_json(spec.transform);
	const auto strategy = ResolveStrategy::from_name(spec.strategy);

	QSet<int> controls;
	for (int c : spec.controls)
		controls.insert(c);

	return CcBinding(controls, sink, spec.param, transform,
		strategy.value_or(ResolveStrategy::most_recent_of_any()), spec.target);
}

int build_bindings(const QVector<CcBindingSpec> &specs,
				   const BindingTargets &targets, CcRouter &router,
				   QStringList *warnings)
{
	int added = 0;
	for (int i = 0; i < specs.size(); i++) {
		QString why;
		auto binding = make_binding(specs[i], targets, &why);
		if (!binding) {
			if (warnings)
				warnings->append(QStringLiteral("binding %1 (%2.%3): %4")
					.arg(i).arg(specs[i].target, specs[i].param, why));
			continue;
		}
		router.add(std::move(*binding));
		added++;
	}
	return added;
}

} // namespace psiwave
