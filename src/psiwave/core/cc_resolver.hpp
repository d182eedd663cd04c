#pragma once

// ============================================================================
// CC Resolver — folds the control values fed to one binding (possibly from
// several MIDI channels) into a single 0..1 unit value.
// ============================================================================

#include "control_types.hpp"

#include <QHash>
#include <QString>

#include <functional>
#include <optional>

namespace psiwave {

// ---------------------------------------------------------------------------
// ResolveStrategy — Tagged choice of aggregation.
//
//   MostRecentOfAny          value with the latest timestamp, any channel
//   AverageOfLastPerChannel  mean of the last value seen on each channel
//   Custom                   caller-supplied function of {channel: value}
// ---------------------------------------------------------------------------
class ResolveStrategy {
public:
	enum class Kind {
		MostRecentOfAny,
		AverageOfLastPerChannel,
		Custom,
	};

	using Aggregate = std::function<double(const QHash<int, int> &per_channel)>;

	static ResolveStrategy most_recent_of_any();
	static ResolveStrategy average_of_last_per_channel();
	static ResolveStrategy custom(Aggregate aggregate);

	// "most_recent_of_any" / "average_of_last_per_channel".
	static std::optional<ResolveStrategy> from_name(const QString &name);

	Kind kind() const { return m_kind; }
	const Aggregate &aggregate() const { return m_aggregate; }
	QString name() const;

private:
	explicit ResolveStrategy(Kind kind, Aggregate aggregate = {})
		: m_kind(kind), m_aggregate(std::move(aggregate)) {}

	Kind m_kind;
	Aggregate m_aggregate;
};

// ---------------------------------------------------------------------------
// CcResolver — Per-binding aggregation state.
// ---------------------------------------------------------------------------
class CcResolver {
public:
	explicit CcResolver(ResolveStrategy strategy = ResolveStrategy::most_recent_of_any());

	// Ingest one event whose control number the owning binding watches.
	void feed(const ControlChangeEvent &event);

	// Unit value, or nullopt until something has been fed.
	std::optional<double> resolve() const;

	void reset();

	const ResolveStrategy &strategy() const { return m_strategy; }
	int channel_count() const { return m_per_channel.size(); }

private:
	ResolveStrategy m_strategy;

	QHash<int, int> m_per_channel;	// channel -> last raw value
	std::optional<int> m_last_value;
	double m_last_timestamp = -1e9;
};

} // namespace psiwave
