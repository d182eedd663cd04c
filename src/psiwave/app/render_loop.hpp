#pragma once

// ============================================================================
// Render Loop — the per-frame pipeline of the demo runner.
//
// Each frame:
//   1. timestamp (seconds since start)
//   2. drain MIDI: Control Changes and notes
//   3. notes -> active effect
//   4. clock sync -> SyncFrame applied to the effects
//   5. CC router -> effect parameters
//   6. time-based effect rotation
//   7. clear, draw active effect, swap
//
// Frames are paced by a single-shot QTimer on the owning thread.
// ============================================================================

#include "app_config.hpp"
#include "binding_builder.hpp"
#include "../modules/time/clock_sync.hpp"

#include <QElapsedTimer>
#include <QObject>
#include <QRandomGenerator>
#include <QStringList>
#include <QTimer>

#include <memory>
#include <vector>

namespace psiwave {

class Canvas;
class CcRouter;
class Effect;
class Matrix;
class MidiInput;
class ScanlineNotesEffect;
class SinwaveEffect;
class StarfieldEffect;
class TextScrollEffect;

class RenderLoop : public QObject {
	Q_OBJECT

public:
	RenderLoop(const AppConfig &config, MidiInput &midi, CcRouter &router,
			   Matrix &matrix, QObject *parent = nullptr);
	~RenderLoop() override;

	// Effect name -> parameter sink, for building the CC bindings.
	BindingTargets targets() const;

	// Names of the effects in rotation, in order.
	QStringList rotation() const;

	Effect *active_effect() const;
	QString active_name() const;

	SinwaveEffect &sinwave() const { return *m_sinwave; }
	StarfieldEffect &starfield() const { return *m_starfield; }
	ScanlineNotesEffect &scanline() const { return *m_scanline; }
	TextScrollEffect &text_scroll() const { return *m_text; }

	bool is_running() const { return m_running; }
	quint64 frame_count() const { return m_frame_count; }

	// Set up every effect and activate the first one. start() also
	// schedules the first frame; prepare() alone leaves pacing to the caller.
	void prepare();
	void start();

	// One full frame at time `now` (seconds since start).
	void run_frame(double now);

public slots:
	// Rotate to the next effect and restart the switch timer.
	void next();

	// Stop pacing and blank the display. Emits finished().
	void stop();

signals:
	void finished();
	void effect_changed(const QString &name);

private:
	void on_frame();
	void schedule_next(double frame_start);

	double now() const;
	void log_notes(const NoteBatch &notes) const;
	void apply_sync(const SyncFrame &frame);
	void switch_to(int rotation_index, double now);

	AppConfig m_config;
	MidiInput &m_midi;
	CcRouter &m_router;
	Matrix &m_matrix;
	ClockSync m_sync;

	std::vector<std::unique_ptr<Effect>> m_effects;	// effect_names() order
	SinwaveEffect *m_sinwave = nullptr;
	StarfieldEffect *m_starfield = nullptr;
	ScanlineNotesEffect *m_scanline = nullptr;
	TextScrollEffect *m_text = nullptr;

	QVector<Effect *> m_rotation;
	int m_active = 0;
	double m_switch_started = 0.0;
	double m_last_now = 0.0;
	bool m_wavelength_synced = false;	// wavelength holds a clock multiplier

	Canvas *m_canvas = nullptr;
	QElapsedTimer m_elapsed;
	QTimer m_frame_timer;
	QRandomGenerator m_rng;
	quint64 m_frame_count = 0;
	bool m_prepared = false;
	bool m_running = false;
};

} // namespace psiwave
