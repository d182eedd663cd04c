#include "cc_router.hpp"

#include "../core/parameter_set.hpp"
#include "utils/log_support.hpp"

#include <QStringList>

#include <algorithm>

namespace psiwave {

std::optional<CcRouter::LogMode> CcRouter::log_mode_from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n == "none")
		return LogMode::None;
	if (n == "mapped")
		return LogMode::Mapped;
	if (n == "all")
		return LogMode::All;
	if (n == "both")
		return LogMode::Both;
	return std::nullopt;
}

QString CcRouter::log_mode_name(LogMode mode)
{
	switch (mode) {
	case LogMode::None:		return QStringLiteral("none");
	case LogMode::Mapped:	return QStringLiteral("mapped");
	case LogMode::All:		return QStringLiteral("all");
	case LogMode::Both:		return QStringLiteral("both");
	}
	return QStringLiteral("none");
}

CcRouter::CcRouter(LogMode log_mode)
	: m_log_mode(log_mode)
{
}

int CcRouter::add(CcBinding binding)
{
	const int index = static_cast<int>(m_bindings.size());
	for (int control : binding.controls())
		m_by_control[control].append(index);
	m_bindings.push_back(std::move(binding));
	return index;
}

void CcRouter::process(const ControlChangeBatch &batch)
{
	if (batch.isEmpty())
		return;

	const bool log_all = m_log_mode == LogMode::All || m_log_mode == LogMode::Both;
	const bool log_mapped = m_log_mode == LogMode::Mapped || m_log_mode == LogMode::Both;

	// Bindings are pushed in insertion order, not event order.
	QVector<bool> touched(static_cast<int>(m_bindings.size()), false);
	bool any_touched = false;
	int mapped_count = 0;
	QSet<int> mapped_seen;

	for (const auto &ev : batch) {
		auto it = m_by_control.constFind(ev.control);
		const bool is_mapped = it != m_by_control.constEnd();

		if (log_all) {
			psi_log(LOG_INFO, "[router] %s t=%7.3fs ch=%2d cc=%3d val=%3d",
				is_mapped ? "mapped" : "unmapped",
				ev.timestamp, ev.channel, ev.control, ev.value);
		}

		if (!is_mapped)
			continue;

		mapped_count++;
		mapped_seen.insert(ev.control);
		for (int index : it.value()) {
			m_bindings[index].resolver().feed(ev);
			touched[index] = true;
			any_touched = true;
		}
	}

	if (!any_touched)
		return;

	if (log_mapped) {
		QVector<int> controls(mapped_seen.begin(), mapped_seen.end());
		std::sort(controls.begin(), controls.end());
		QStringList nums;
		for (int c : controls)
			nums.append(QString::number(c));
		psi_log(LOG_INFO, "[router] mapped CC detected (%d msg%s) controls=[%s]",
			mapped_count, mapped_count == 1 ? "" : "s",
			nums.join(", ").toUtf8().constData());
	}

	for (int i = 0; i < static_cast<int>(m_bindings.size()); i++) {
		if (!touched[i])
			continue;

		auto &binding = m_bindings[i];
		const std::optional<double> unit = binding.resolver().resolve();
		if (!unit)
			continue;

		const double value = binding.transform().apply(*unit);

		if (!binding.target()) {
			psi_log(LOG_WARNING, "[router] binding %s has no target",
				binding.describe().toUtf8().constData());
			continue;
		}

		if (!binding.target()->set_parameter(binding.param(), value)) {
			psi_log(LOG_WARNING, "[router] %s rejected parameter '%s'",
				binding.target_name().isEmpty()
					? "target" : binding.target_name().toUtf8().constData(),
				binding.param().toUtf8().constData());
			continue;
		}

		if (log_mapped) {
			psi_log(LOG_INFO, "[router] %s -> %.3f",
				binding.param().toUtf8().constData(), value);
		}
	}
}

void CcRouter::reset()
{
	for (auto &b : m_bindings)
		b.resolver().reset();
}

QSet<int> CcRouter::mapped_controls() const
{
	QSet<int> result;
	for (auto it = m_by_control.constBegin(); it != m_by_control.constEnd(); ++it)
		result.insert(it.key());
	return result;
}

QString CcRouter::describe() const
{
	QStringList parts;
	for (const auto &b : m_bindings)
		parts.append(b.describe());
	return parts.join(' ');
}

} // namespace psiwave
