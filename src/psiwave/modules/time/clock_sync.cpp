#include "clock_sync.hpp"

#include "../../core/control_types.hpp"
#include "utils/log_support.hpp"

#include <QByteArray>

#include <algorithm>
#include <cmath>

namespace psiwave {

namespace {

constexpr double kTwoPi = 6.283185307179586;

QByteArray fmt_optional(const std::optional<double> &v, int precision)
{
	if (!v)
		return QByteArrayLiteral("?");
	return QByteArray::number(*v, 'f', precision);
}

} // namespace

// ===== Tick arithmetic ====================================================

double beat_position(quint64 ticks)
{
	return static_cast<double>(ticks) / kMidiClockPpqn;
}

qint64 beat_index(quint64 ticks)
{
	return static_cast<qint64>(ticks / kMidiClockPpqn);
}

double bar_phase(quint64 ticks)
{
	const double beats = beat_position(ticks);
	return std::fmod(beats, static_cast<double>(kBeatsPerBar)) / kBeatsPerBar;
}

double cycle_phase(quint64 ticks, double beats_per_cycle)
{
	if (beats_per_cycle <= 0.0)
		beats_per_cycle = 1.0;
	return kTwoPi * (beat_position(ticks) / beats_per_cycle);
}

std::optional<double> wavelength_multiplier(std::optional<double> bpm,
											double ref_bpm,
											double min_mult, double max_mult)
{
	if (!bpm || !(*bpm > 0.0))
		return std::nullopt;
	const double ref = ref_bpm > 0.0 ? ref_bpm : 120.0;
	return std::max(min_mult, std::min(max_mult, ref / *bpm));
}

// ===== Modes ==============================================================

std::optional<SyncMode> sync_mode_from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n == "off")
		return SyncMode::Off;
	if (n == "speed" || n == "wavelength")
		return SyncMode::Speed;
	if (n == "spatial")
		return SyncMode::Spatial;
	if (n == "both")
		return SyncMode::Both;
	return std::nullopt;
}

QString sync_mode_name(SyncMode mode)
{
	switch (mode) {
	case SyncMode::Off:		return QStringLiteral("off");
	case SyncMode::Speed:	return QStringLiteral("speed");
	case SyncMode::Spatial:	return QStringLiteral("spatial");
	case SyncMode::Both:	return QStringLiteral("both");
	}
	return QStringLiteral("off");
}

std::optional<ClockLogMode> clock_log_mode_from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n == "none")
		return ClockLogMode::None;
	if (n == "bpm")
		return ClockLogMode::Bpm;
	if (n == "clock")
		return ClockLogMode::Clock;
	return std::nullopt;
}

QString clock_log_mode_name(ClockLogMode mode)
{
	switch (mode) {
	case ClockLogMode::None:	return QStringLiteral("none");
	case ClockLogMode::Bpm:		return QStringLiteral("bpm");
	case ClockLogMode::Clock:	return QStringLiteral("clock");
	}
	return QStringLiteral("none");
}

// ===== ClockSync ==========================================================

ClockSync::ClockSync(const ClockSyncConfig &config)
	: m_config(config)
{
}

SyncFrame ClockSync::update(ClockTracker &clock, double now)
{
	SyncFrame frame;
	if (!enabled())
		return frame;

	const ClockState state = clock.clock_state();
	frame.start_pulse = state.start_pulse;
	frame.running = state.running;
	frame.bpm = state.bpm;

	if (state.start_pulse)
		m_last_beat_index.reset();

	if (!state.running) {
		frame.release_overrides = true;
		log_stopped(clock, now);
		return frame;
	}

	log_running(clock, now);

	const quint64 ticks = clock.tick_count();

	frame.beat_index = beat_index(ticks);
	if (!m_last_beat_index || *m_last_beat_index != frame.beat_index) {
		m_last_beat_index = frame.beat_index;
		frame.beat_edge = true;
	}

	frame.text_scroll_px = beat_position(ticks) * kTextPixelsPerBeat;
	frame.sweep_phase = bar_phase(ticks);

	const bool speed = m_config.mode == SyncMode::Speed || m_config.mode == SyncMode::Both;
	const bool spatial = m_config.mode == SyncMode::Spatial || m_config.mode == SyncMode::Both;

	if (speed)
		frame.wave_phase = cycle_phase(ticks, m_config.beats_per_cycle);

	if (spatial) {
		frame.wavelength_mult = wavelength_multiplier(state.bpm, m_config.ref_bpm,
			m_config.wavelength_min, m_config.wavelength_max);
	}

	return frame;
}

void ClockSync::log_running(const ClockTracker &clock, double now)
{
	const QByteArray mode = sync_mode_name(m_config.mode).toUtf8();

	if (m_config.log_mode == ClockLogMode::Clock) {
		if (now - m_last_log_time < 2.0)
			return;
		m_last_log_time = now;
		const ClockDebugState d = clock.debug_state();
		psi_log(LOG_INFO,
			"[clock] running=true bpm=%s ticks=%llu last_dt=%ss win=%d sync=%s",
			fmt_optional(d.bpm, 2).constData(),
			static_cast<unsigned long long>(d.tick_count),
			fmt_optional(d.last_interval, 4).constData(),
			d.window_size, mode.constData());
	} else if (m_config.log_mode == ClockLogMode::Bpm) {
		if (now - m_last_log_time < 1.0)
			return;
		m_last_log_time = now;
		const ClockDebugState d = clock.debug_state();
		if (d.bpm && *d.bpm > 0.0) {
			psi_log(LOG_INFO, "[clock] running bpm=%.2f sync=%s",
				*d.bpm, mode.constData());
		} else {
			psi_log(LOG_INFO, "[clock] running (estimating...) ticks=%llu win=%d sync=%s",
				static_cast<unsigned long long>(d.tick_count),
				d.window_size, mode.constData());
		}
	}
}

void ClockSync::log_stopped(const ClockTracker &clock, double now)
{
	if (m_config.log_mode != ClockLogMode::Clock)
		return;
	if (now - m_last_log_time < 1.0)
		return;
	m_last_log_time = now;

	const ClockDebugState d = clock.debug_state();
	psi_log(LOG_INFO,
		"[clock] running=%s bpm=%s ticks=%llu last_dt=%ss win=%d sync=%s",
		d.running ? "true" : "false",
		fmt_optional(d.bpm, 2).constData(),
		static_cast<unsigned long long>(d.tick_count),
		fmt_optional(d.last_interval, 4).constData(),
		d.window_size,
		sync_mode_name(m_config.mode).toUtf8().constData());
}

} // namespace psiwave
