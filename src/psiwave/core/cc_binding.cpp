#include "cc_binding.hpp"

#include <QJsonArray>
#include <QStringList>

#include <algorithm>

namespace psiwave {

// ===== CcBindingSpec ======================================================

bool CcBindingSpec::validate(QString *error) const
{
	auto fail = [error](const QString &msg) {
		if (error)
			*error = msg;
		return false;
	};

	if (controls.isEmpty())
		return fail(QStringLiteral("no control numbers"));
	for (int c : controls) {
		if (c < 0 || c > kMaxControlValue)
			return fail(QStringLiteral("control number %1 out of range 0-127").arg(c));
	}
	if (target.isEmpty())
		return fail(QStringLiteral("missing target"));
	if (param.isEmpty())
		return fail(QStringLiteral("missing param"));
	if (!ResolveStrategy::from_name(strategy))
		return fail(QStringLiteral("unknown strategy '%1'").arg(strategy));

	QString transform_error;
	if (!transform_from_json(transform, &transform_error))
		return fail(transform_error);

	return true;
}

QJsonObject CcBindingSpec::to_json() const
{
	QJsonObject o;
	QJsonArray arr;
	for (int c : controls)
		arr.append(c);
	o["controls"] = arr;
	o["target"] = target;
	o["param"] = param;
	if (!transform.isEmpty())
		o["transform"] = transform;
	if (!strategy.isEmpty())
		o["strategy"] = strategy;
	return o;
}

CcBindingSpec CcBindingSpec::from_json(const QJsonObject &obj)
{
	CcBindingSpec s;

	// "controls": [101, 102] or the shorthand "control": 101
	if (obj.contains("controls")) {
		for (const auto &v : obj["controls"].toArray())
			s.controls.append(v.toInt(-1));
	} else if (obj.contains("control")) {
		s.controls.append(obj["control"].toInt(-1));
	}

	s.target = obj["target"].toString();
	s.param = obj["param"].toString();
	s.transform = obj["transform"].toObject();
	s.strategy = obj["strategy"].toString();
	return s;
}

// ===== CcBinding ==========================================================

CcBinding::CcBinding(const QSet<int> &controls, ParameterSink *target,
					 const QString &param, ControlTransformPtr transform,
					 ResolveStrategy strategy, const QString &target_name)
	: m_controls(controls)
	, m_target(target)
	, m_target_name(target_name)
	, m_param(param)
	, m_transform(transform ? std::move(transform)
							: std::make_shared<IdentityTransform>())
	, m_resolver(std::move(strategy))
{
}

QVector<int> CcBinding::sorted_controls() const
{
	QVector<int> sorted(m_controls.begin(), m_controls.end());
	std::sort(sorted.begin(), sorted.end());
	return sorted;
}

QString CcBinding::describe() const
{
	QStringList nums;
	for (int c : sorted_controls())
		nums.append(QString::number(c));
	return QStringLiteral("%1=cc[%2]").arg(m_param, nums.join(", "));
}

} // namespace psiwave
