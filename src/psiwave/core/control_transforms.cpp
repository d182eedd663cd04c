#include "control_transforms.hpp"
#include "control_types.hpp"

#include <cmath>

namespace psiwave {

double sigmoid01(double x, double threshold, double steepness)
{
	x = clamp01(x);
	if (x <= 0.0)
		return 0.0;
	if (x >= 1.0)
		return 1.0;

	const double t = clamp01(threshold);
	const double k = steepness;
	if (!(k > 0.0))
		return x;

	// Two-branch form keeps exp() from overflowing for large k.
	const double z = k * (x - t);
	if (z >= 0.0)
		return 1.0 / (1.0 + std::exp(-z));
	const double ez = std::exp(z);
	return ez / (1.0 + ez);
}

// ===== IdentityTransform ==================================================

QJsonObject IdentityTransform::to_json() const
{
	QJsonObject o;
	o["kind"] = QStringLiteral("identity");
	return o;
}

// ===== LinearTransform ====================================================

double LinearTransform::apply(double unit) const
{
	return lerp(m_low, m_high, unit);
}

QString LinearTransform::name() const
{
	return QStringLiteral("Linear(%1, %2)").arg(m_low).arg(m_high);
}

QJsonObject LinearTransform::to_json() const
{
	QJsonObject o;
	o["kind"] = QStringLiteral("linear");
	o["low"] = m_low;
	o["high"] = m_high;
	return o;
}

// ===== SigmoidTransform ===================================================

double SigmoidTransform::apply(double unit) const
{
	return lerp(m_low, m_high, sigmoid01(unit, m_threshold, m_steepness));
}

QString SigmoidTransform::name() const
{
	return QStringLiteral("Sigmoid(%1, %2, thr=%3, k=%4)")
		.arg(m_low).arg(m_high)
		.arg(m_threshold).arg(m_steepness);
}

QJsonObject SigmoidTransform::to_json() const
{
	QJsonObject o;
	o["kind"] = QStringLiteral("sigmoid");
	o["low"] = m_low;
	o["high"] = m_high;
	o["threshold"] = m_threshold;
	o["steepness"] = m_steepness;
	return o;
}

// ===== RawCcTransform =====================================================

double RawCcTransform::apply(double unit) const
{
	return unit * static_cast<double>(kMaxControlValue);
}

QJsonObject RawCcTransform::to_json() const
{
	QJsonObject o;
	o["kind"] = QStringLiteral("raw");
	return o;
}

// ===== Factory ============================================================

ControlTransformPtr transform_from_json(const QJsonObject &obj, QString *error)
{
	const QString kind = obj["kind"].toString(QStringLiteral("identity")).toLower();

	if (kind == "identity")
		return std::make_shared<IdentityTransform>();
	if (kind == "linear")
		return std::make_shared<LinearTransform>(
			obj["low"].toDouble(0.0), obj["high"].toDouble(1.0));
	if (kind == "sigmoid")
		return std::make_shared<SigmoidTransform>(
			obj["low"].toDouble(0.0), obj["high"].toDouble(1.0),
			obj["threshold"].toDouble(0.5), obj["steepness"].toDouble(10.0));
	if (kind == "raw" || kind == "raw_cc")
		return std::make_shared<RawCcTransform>();

	if (error)
		*error = QStringLiteral("unknown transform kind '%1'").arg(kind);
	return nullptr;
}

} // namespace psiwave
