#pragma once

// ============================================================================
// Control Transforms — map a resolved 0..1 unit value onto the physical
// range of an effect parameter.
//
// A binding owns exactly one transform; transforms are stateless so one
// instance may be shared between bindings.
// ============================================================================

#include <QJsonObject>
#include <QString>

#include <memory>

namespace psiwave {

// Logistic curve on [0,1] crossing 0.5 at `threshold`.
// Endpoints are forced (0 -> 0, 1 -> 1); steepness <= 0 is linear.
double sigmoid01(double x, double threshold, double steepness);

// ---------------------------------------------------------------------------
// ControlTransform — Abstract base for unit-to-parameter mappings.
// ---------------------------------------------------------------------------
class ControlTransform {
public:
	virtual ~ControlTransform() = default;

	virtual double apply(double unit) const = 0;

	// Human-readable name for logging.
	virtual QString name() const = 0;

	virtual QJsonObject to_json() const = 0;
};

using ControlTransformPtr = std::shared_ptr<const ControlTransform>;

// ---------------------------------------------------------------------------
// IdentityTransform — Passes the unit value through.
// ---------------------------------------------------------------------------
class IdentityTransform : public ControlTransform {
public:
	double apply(double unit) const override { return unit; }
	QString name() const override { return QStringLiteral("Identity"); }
	QJsonObject to_json() const override;
};

// ---------------------------------------------------------------------------
// LinearTransform — low + (high - low) * unit. low > high inverts.
// ---------------------------------------------------------------------------
class LinearTransform : public ControlTransform {
public:
	LinearTransform(double low, double high) : m_low(low), m_high(high) {}

	double apply(double unit) const override;
	QString name() const override;
	QJsonObject to_json() const override;

	double low() const { return m_low; }
	double high() const { return m_high; }

private:
	double m_low, m_high;
};

// ---------------------------------------------------------------------------
// SigmoidTransform — sigmoid01() then remap into [low, high].
// ---------------------------------------------------------------------------
class SigmoidTransform : public ControlTransform {
public:
	SigmoidTransform(double low, double high,
					 double threshold = 0.5, double steepness = 10.0)
		: m_low(low), m_high(high)
		, m_threshold(threshold), m_steepness(steepness) {}

	double apply(double unit) const override;
	QString name() const override;
	QJsonObject to_json() const override;

	double threshold() const { return m_threshold; }
	double steepness() const { return m_steepness; }

private:
	double m_low, m_high, m_threshold, m_steepness;
};

// ---------------------------------------------------------------------------
// RawCcTransform — Recovers the 0..127 control byte (unit * 127).
// ---------------------------------------------------------------------------
class RawCcTransform : public ControlTransform {
public:
	double apply(double unit) const override;
	QString name() const override { return QStringLiteral("RawCC"); }
	QJsonObject to_json() const override;
};

// Build a transform from {"kind": "identity"|"linear"|"sigmoid"|"raw", ...}.
// Returns nullptr and fills `error` on an unknown kind.
ControlTransformPtr transform_from_json(const QJsonObject &obj,
										QString *error = nullptr);

} // namespace psiwave
