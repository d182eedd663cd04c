#include "clock_tracker.hpp"

#include "../../core/control_types.hpp"
#include "utils/log_support.hpp"

#include <numeric>

namespace psiwave {

void ClockTracker::clear_estimate()
{
	m_tick_count = 0;
	m_last_tick_time.reset();
	m_last_interval.reset();
	m_intervals.clear();
	m_bpm.reset();
}

void ClockTracker::on_start()
{
	m_running = true;
	clear_estimate();
	m_start_pulse = true;
}

void ClockTracker::on_continue()
{
	m_running = true;
}

void ClockTracker::on_stop()
{
	m_running = false;
	clear_estimate();
}

void ClockTracker::on_tick(double now)
{
	if (!m_first_tick_seen) {
		m_first_tick_seen = true;
		psi_log(LOG_INFO, "[clock] first clock tick received (MIDI clock sync active)");
	}

	// A tick without Start/Continue still means the transport is running.
	m_running = true;
	m_tick_count++;

	if (m_last_tick_time) {
		const double dt = now - *m_last_tick_time;
		m_last_interval = dt;

		if (dt >= kMinInterval && dt <= kMaxInterval) {
			m_intervals.push_back(dt);
			while (static_cast<int>(m_intervals.size()) > kWindowSize)
				m_intervals.pop_front();

			if (static_cast<int>(m_intervals.size()) >= kMinSamples) {
				const double sum = std::accumulate(
					m_intervals.begin(), m_intervals.end(), 0.0);
				const double mean = sum / static_cast<double>(m_intervals.size());
				if (mean > 0.0)
					m_bpm = 60.0 / (mean * kMidiClockPpqn);
			}
		}
	}

	m_last_tick_time = now;
}

ClockState ClockTracker::clock_state()
{
	ClockState state;
	state.running = m_running;
	state.bpm = m_bpm;
	state.start_pulse = m_start_pulse;
	m_start_pulse = false;
	return state;
}

ClockDebugState ClockTracker::debug_state() const
{
	ClockDebugState state;
	state.running = m_running;
	state.bpm = m_bpm;
	state.tick_count = m_tick_count;
	state.last_interval = m_last_interval;
	state.window_size = static_cast<int>(m_intervals.size());
	return state;
}

} // namespace psiwave
