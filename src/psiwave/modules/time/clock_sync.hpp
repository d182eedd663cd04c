#pragma once

// ============================================================================
// Clock Sync
//
// Per-frame orchestration between the ClockTracker and the effects.
// ClockSync does not touch any effect itself: it reduces the clock to a
// SyncFrame which the render loop applies.
// ============================================================================

#include "clock_tracker.hpp"

#include <QString>
#include <QtGlobal>

#include <optional>

namespace psiwave {

// ---------------------------------------------------------------------------
// Tick arithmetic (24 PPQN)
// ---------------------------------------------------------------------------

// Beats elapsed since Start, fractional.
double beat_position(quint64 ticks);

// Whole beats since Start. Changes value on each beat edge.
qint64 beat_index(quint64 ticks);

// Position within a 4-beat bar, in [0, 1).
double bar_phase(quint64 ticks);

// Animation phase in radians: 2π per `beats_per_cycle` beats.
// beats_per_cycle <= 0 is treated as 1.
double cycle_phase(quint64 ticks, double beats_per_cycle);

// ref_bpm / bpm clamped to [min_mult, max_mult]; ref_bpm <= 0 means 120.
// nullopt while the tempo is unknown or not positive.
std::optional<double> wavelength_multiplier(std::optional<double> bpm,
											double ref_bpm,
											double min_mult, double max_mult);

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------
enum class SyncMode {
	Off,
	Speed,		// Lock the wave phase to the beat
	Spatial,	// Map tempo to the wave's spatial wavelength
	Both,
};

// Accepts "wavelength" as an alias for "speed".
std::optional<SyncMode> sync_mode_from_name(const QString &name);
QString sync_mode_name(SyncMode mode);

enum class ClockLogMode {
	None,
	Bpm,	// Tempo once per second while running
	Clock,	// Full debug state, every 2 s running / 1 s stopped
};

std::optional<ClockLogMode> clock_log_mode_from_name(const QString &name);
QString clock_log_mode_name(ClockLogMode mode);

struct ClockSyncConfig {
	SyncMode mode = SyncMode::Speed;
	double ref_bpm = 120.0;
	double wavelength_min = 0.25;
	double wavelength_max = 2.0;
	double beats_per_cycle = 2.0;
	ClockLogMode log_mode = ClockLogMode::None;
};

// ---------------------------------------------------------------------------
// SyncFrame — Everything the render loop applies for one frame.
// Unset optionals leave the effect's own state untouched.
// ---------------------------------------------------------------------------
struct SyncFrame {
	bool start_pulse = false;
	bool running = false;
	bool beat_edge = false;
	qint64 beat_index = -1;
	std::optional<double> bpm;

	std::optional<double> text_scroll_px;	// 8 px per beat
	std::optional<double> sweep_phase;		// Bar phase, 0..1
	std::optional<double> wave_phase;		// Speed / Both only
	std::optional<double> wavelength_mult;	// Spatial / Both only

	// Clock stopped: every clock-driven override must be dropped.
	bool release_overrides = false;
};

// ---------------------------------------------------------------------------
// ClockSync
// ---------------------------------------------------------------------------
class ClockSync {
public:
	static constexpr double kTextPixelsPerBeat = 8.0;

	explicit ClockSync(const ClockSyncConfig &config = ClockSyncConfig());

	bool enabled() const { return m_config.mode != SyncMode::Off; }
	const ClockSyncConfig &config() const { return m_config; }

	// Consumes the tracker's start pulse. Returns an empty frame when
	// sync is off.
	SyncFrame update(ClockTracker &clock, double now);

private:
	void log_running(const ClockTracker &clock, double now);
	void log_stopped(const ClockTracker &clock, double now);

	ClockSyncConfig m_config;
	std::optional<qint64> m_last_beat_index;
	double m_last_log_time = -1e9;
};

} // namespace psiwave
