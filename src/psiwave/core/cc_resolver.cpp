#include "cc_resolver.hpp"

#include <cmath>

namespace psiwave {

// ===== ResolveStrategy ====================================================

ResolveStrategy ResolveStrategy::most_recent_of_any()
{
	return ResolveStrategy(Kind::MostRecentOfAny);
}

ResolveStrategy ResolveStrategy::average_of_last_per_channel()
{
	return ResolveStrategy(Kind::AverageOfLastPerChannel);
}

ResolveStrategy ResolveStrategy::custom(Aggregate aggregate)
{
	return ResolveStrategy(Kind::Custom, std::move(aggregate));
}

std::optional<ResolveStrategy> ResolveStrategy::from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n.isEmpty() || n == "most_recent_of_any")
		return most_recent_of_any();
	if (n == "average_of_last_per_channel")
		return average_of_last_per_channel();
	return std::nullopt;
}

QString ResolveStrategy::name() const
{
	switch (m_kind) {
	case Kind::MostRecentOfAny:			return QStringLiteral("most_recent_of_any");
	case Kind::AverageOfLastPerChannel:	return QStringLiteral("average_of_last_per_channel");
	case Kind::Custom:					return QStringLiteral("custom");
	}
	return QStringLiteral("unknown");
}

// ===== CcResolver =========================================================

CcResolver::CcResolver(ResolveStrategy strategy)
	: m_strategy(std::move(strategy))
{
}

void CcResolver::feed(const ControlChangeEvent &event)
{
	m_per_channel.insert(event.channel, event.value);
	if (event.timestamp >= m_last_timestamp) {
		m_last_value = event.value;
		m_last_timestamp = event.timestamp;
	}
}

std::optional<double> CcResolver::resolve() const
{
	if (!m_last_value)
		return std::nullopt;

	switch (m_strategy.kind()) {
	case ResolveStrategy::Kind::Custom:
		if (m_strategy.aggregate())
			return clamp01(m_strategy.aggregate()(m_per_channel));
		break;

	case ResolveStrategy::Kind::AverageOfLastPerChannel: {
		if (m_per_channel.isEmpty())
			return std::nullopt;
		double sum = 0.0;
		for (int v : m_per_channel)
			sum += v;
		const double avg = sum / m_per_channel.size();
		// Halves go to the even neighbour (default FE_TONEAREST).
		return cc_unit(static_cast<int>(std::nearbyint(avg)));
	}

	case ResolveStrategy::Kind::MostRecentOfAny:
		break;
	}

	return cc_unit(*m_last_value);
}

void CcResolver::reset()
{
	m_per_channel.clear();
	m_last_value.reset();
	m_last_timestamp = -1e9;
}

} // namespace psiwave
