#pragma once

// ============================================================================
// Clock Tracker
//
// Decodes the MIDI real-time clock (24 pulses per quarter note) into:
//   • transport state (stopped / running)
//   • a tick counter reset on Start and Stop
//   • a smoothed tempo estimate from a bounded window of tick intervals
//   • a one-shot start pulse, consumed by clock_state()
// ============================================================================

#include <QtGlobal>

#include <deque>
#include <optional>

namespace psiwave {

// Snapshot returned by ClockTracker::clock_state().
struct ClockState {
	bool running = false;
	std::optional<double> bpm;
	bool start_pulse = false;
};

// Non-consuming snapshot for logging.
struct ClockDebugState {
	bool running = false;
	std::optional<double> bpm;
	quint64 tick_count = 0;
	std::optional<double> last_interval;	// Last Δt seen, accepted or not
	int window_size = 0;
};

// ---------------------------------------------------------------------------
// ClockTracker
// ---------------------------------------------------------------------------
class ClockTracker {
public:
	// Intervals outside [kMinInterval, kMaxInterval] seconds are spurious.
	static constexpr double kMinInterval = 0.002;
	static constexpr double kMaxInterval = 0.25;
	static constexpr int kWindowSize = 96;
	static constexpr int kMinSamples = 4;

	// -- Transport --
	void on_start();
	void on_continue();
	void on_stop();

	// One clock pulse received at `now` (seconds).
	void on_tick(double now);

	// -- Queries --

	// Consumes the start pulse.
	ClockState clock_state();
	ClockDebugState debug_state() const;

	bool is_running() const { return m_running; }
	std::optional<double> bpm() const { return m_bpm; }
	quint64 tick_count() const { return m_tick_count; }
	bool first_tick_seen() const { return m_first_tick_seen; }

private:
	void clear_estimate();

	bool m_running = false;
	quint64 m_tick_count = 0;
	std::optional<double> m_last_tick_time;
	std::optional<double> m_last_interval;
	std::deque<double> m_intervals;
	std::optional<double> m_bpm;
	bool m_start_pulse = false;
	bool m_first_tick_seen = false;
};

} // namespace psiwave
