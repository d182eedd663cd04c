#pragma once

// ============================================================================
// CC Router — owns every CcBinding, demultiplexes incoming Control Change
// batches to the bindings that watch them and pushes resolved values into
// their parameter sinks.
// ============================================================================

#include "../core/cc_binding.hpp"
#include "../core/control_types.hpp"

#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>

#include <optional>
#include <vector>

namespace psiwave {

class CcRouter {
public:
	// What process() writes to the log.
	//   Mapped  per-batch summary of mapped controls and each pushed value
	//   All     every received CC tagged mapped / unmapped
	enum class LogMode {
		None,
		Mapped,
		All,
		Both,
	};

	static std::optional<LogMode> log_mode_from_name(const QString &name);
	static QString log_mode_name(LogMode mode);

	explicit CcRouter(LogMode log_mode = LogMode::None);

	// Returns the index of the new binding.
	int add(CcBinding binding);

	// Feed the batch to the watching bindings, then resolve, transform and
	// push every binding the batch touched. Bindings not touched by this
	// batch are not re-pushed.
	void process(const ControlChangeBatch &batch);

	// Clears the resolver state of every binding.
	void reset();

	int binding_count() const { return static_cast<int>(m_bindings.size()); }

	// Every control number with at least one binding.
	QSet<int> mapped_controls() const;

	// "speed=cc[101] color=cc[102]" for startup logging.
	QString describe() const;


private:
	std::vector<CcBinding> m_bindings;
	QHash<int, QVector<int>> m_by_control;	// control -> binding indices
	LogMode m_log_mode;
};

} // namespace psiwave
