#pragma once

// ============================================================================
// CC Binding — declarative link from a set of control numbers to one
// (target, parameter) pair through a transform and a resolver.
//
// Many-to-many in both directions: several bindings may watch the same
// control number, and one binding may watch several control numbers.
// ============================================================================

#include "cc_resolver.hpp"
#include "control_transforms.hpp"

#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QVector>

namespace psiwave {

class ParameterSink;

// ---------------------------------------------------------------------------
// CcBindingSpec — Serializable description of a binding.
// The target is named; it is resolved to a live sink when the binding
// is built.
// ---------------------------------------------------------------------------
struct CcBindingSpec {
	QVector<int> controls;		// 0-127
	QString target;				// "sinwave", "starfield", ...
	QString param;				// Parameter name on the target
	QJsonObject transform;		// {"kind": "linear", "low": 0, "high": 2}
	QString strategy;			// Empty = most_recent_of_any

	// False (with a reason in `error`) if the spec cannot be built.
	bool validate(QString *error = nullptr) const;

	QJsonObject to_json() const;
	static CcBindingSpec from_json(const QJsonObject &obj);
};

// ---------------------------------------------------------------------------
// CcBinding — Live binding owned by the router.
// ---------------------------------------------------------------------------
class CcBinding {
public:
	// A null transform means identity.
	CcBinding(const QSet<int> &controls, ParameterSink *target,
			  const QString &param, ControlTransformPtr transform = nullptr,
			  ResolveStrategy strategy = ResolveStrategy::most_recent_of_any(),
			  const QString &target_name = QString());

	const QSet<int> &controls() const { return m_controls; }
	bool watches(int control) const { return m_controls.contains(control); }
	QVector<int> sorted_controls() const;

	ParameterSink *target() const { return m_target; }
	const QString &target_name() const { return m_target_name; }
	const QString &param() const { return m_param; }

	const ControlTransform &transform() const { return *m_transform; }

	CcResolver &resolver() { return m_resolver; }
	const CcResolver &resolver() const { return m_resolver; }

	// "speed=cc[101]"
	QString describe() const;

private:
	QSet<int> m_controls;
	ParameterSink *m_target;
	QString m_target_name;
	QString m_param;
	ControlTransformPtr m_transform;
	CcResolver m_resolver;
};

} // namespace psiwave
