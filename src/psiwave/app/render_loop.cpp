#include "render_loop.hpp"

#include "../effects/effect.hpp"
#include "../effects/scanline_notes_effect.hpp"
#include "../effects/sinwave_effect.hpp"
#include "../effects/starfield_effect.hpp"
#include "../effects/text_scroll_effect.hpp"
#include "../io/cc_router.hpp"
#include "../io/midi_input.hpp"
#include "../render/canvas.hpp"
#include "utils/log_support.hpp"

#include <algorithm>
#include <cmath>

namespace psiwave {

RenderLoop::RenderLoop(const AppConfig &config, MidiInput &midi,
					   CcRouter &router, Matrix &matrix, QObject *parent)
	: QObject(parent)
	, m_config(config)
	, m_midi(midi)
	, m_router(router)
	, m_matrix(matrix)
	, m_sync(config.sync)
	, m_rng(QRandomGenerator::global()->generate())
{
	auto starfield = std::make_unique<StarfieldEffect>();
	auto sinwave = std::make_unique<SinwaveEffect>();
	auto text = std::make_unique<TextScrollEffect>();
	auto scanline = std::make_unique<ScanlineNotesEffect>(
		config.note_log == NoteLogMode::All);

	m_starfield = starfield.get();
	m_sinwave = sinwave.get();
	m_text = text.get();
	m_scanline = scanline.get();

	m_effects.push_back(std::move(starfield));
	m_effects.push_back(std::move(sinwave));
	m_effects.push_back(std::move(text));
	m_effects.push_back(std::move(scanline));

	for (auto &fx : m_effects) {
		if (config.solo.isEmpty() || fx->name() == config.solo)
			m_rotation.append(fx.get());
	}
	// An unknown solo name is rejected by AppConfig::parse.
	if (m_rotation.isEmpty())
		m_rotation.append(m_effects.front().get());

	if (config.midi_log != CcRouter::LogMode::None)
		m_starfield->set_debug(true);

	m_frame_timer.setSingleShot(true);
	m_frame_timer.setTimerType(Qt::PreciseTimer);
	connect(&m_frame_timer, &QTimer::timeout, this, &RenderLoop::on_frame);
}

RenderLoop::~RenderLoop() = default;

BindingTargets RenderLoop::targets() const
{
	BindingTargets t;
	for (const auto &fx : m_effects)
		t.insert(fx->name(), fx.get());
	return t;
}

QStringList RenderLoop::rotation() const
{
	QStringList names;
	for (Effect *fx : m_rotation)
		names << fx->name();
	return names;
}

Effect *RenderLoop::active_effect() const
{
	return m_rotation.value(m_active, nullptr);
}

QString RenderLoop::active_name() const
{
	Effect *fx = active_effect();
	return fx ? fx->name() : QString();
}

// ============================================================================
// Lifecycle
// ============================================================================

void RenderLoop::prepare()
{
	if (m_prepared)
		return;
	m_prepared = true;

	for (auto &fx : m_effects)
		fx->setup(m_matrix);

	m_canvas = m_matrix.create_frame_canvas();

	if (m_sync.enabled() && !m_midi.is_enabled())
		psi_log(LOG_WARNING, "[midi] --midi-sync is %s but MIDI input is disabled",
			qUtf8Printable(sync_mode_name(m_sync.config().mode)));

	m_active = 0;
	m_switch_started = 0.0;
	m_rotation[m_active]->activate();
	m_elapsed.start();
}

void RenderLoop::start()
{
	prepare();
	m_running = true;

	psi_log(LOG_INFO, "Starting demo: %s (switch every %.0fs). Press 'n' for next effect.",
		qUtf8Printable(active_name()), m_config.switch_seconds);

	m_frame_timer.start(0);
}

void RenderLoop::stop()
{
	if (!m_running && !m_prepared)
		return;

	m_frame_timer.stop();
	m_running = false;
	m_prepared = false;
	m_matrix.clear();

	psi_log(LOG_INFO, "Exiting after %llu frames",
		static_cast<unsigned long long>(m_frame_count));
	emit finished();
}

void RenderLoop::next()
{
	if (m_rotation.isEmpty())
		return;
	switch_to((m_active + 1) % m_rotation.size(), m_last_now);
}

// ============================================================================
// Frame
// ============================================================================

double RenderLoop::now() const
{
	return static_cast<double>(m_elapsed.nsecsElapsed()) / 1e9;
}

void RenderLoop::on_frame()
{
	if (!m_running)
		return;

	const double frame_start = now();
	run_frame(frame_start);
	schedule_next(frame_start);
}

void RenderLoop::schedule_next(double frame_start)
{
	if (!m_running)
		return;

	int delay_ms = 0;
	if (m_config.target_fps > 0.0) {
		const double budget = 1.0 / m_config.target_fps;
		const double remaining = budget - (now() - frame_start);
		if (remaining > 0.0)
			delay_ms = static_cast<int>(std::lround(remaining * 1000.0));
	}
	m_frame_timer.start(delay_ms);
}

void RenderLoop::run_frame(double t)
{
	prepare();
	m_last_now = t;

	// -- MIDI --
	const ControlChangeBatch ccs = m_midi.drain(t);
	const NoteBatch notes = m_midi.drain_notes();

	if (!notes.isEmpty()) {
		log_notes(notes);
		Effect *fx = active_effect();
		for (const NoteEvent &n : notes)
			fx->handle_note(n);
	}

	// -- Clock sync --
	if (m_sync.enabled())
		apply_sync(m_sync.update(m_midi.clock(), t));

	// -- CC routing --
	m_router.process(ccs);

	// -- Rotation --
	if (m_rotation.size() > 1 && m_config.switch_seconds > 0.0 &&
		t - m_switch_started >= m_config.switch_seconds)
		switch_to((m_active + 1) % m_rotation.size(), t);

	// -- Draw --
	m_canvas->clear();
	active_effect()->draw(*m_canvas, t);
	m_canvas = m_matrix.swap_on_vsync(m_canvas);
	m_frame_count++;
}

void RenderLoop::log_notes(const NoteBatch &notes) const
{
	if (m_config.note_log != NoteLogMode::All)
		return;

	for (const NoteEvent &n : notes) {
		const int pc = (n.note >= 0 && n.note <= kMaxControlValue) ? n.note % 12 : -1;
		psi_log(LOG_INFO, "[midi] note t=%7.3fs ch=%2d note=%3d vel=%3d pc=%2d state=%s",
			n.timestamp, n.channel, n.note, n.velocity, pc, n.is_on ? "on" : "off");
	}
}

void RenderLoop::apply_sync(const SyncFrame &frame)
{
	if (frame.start_pulse)
		m_sinwave->activate();

	if (frame.release_overrides) {
		m_sinwave->set_external_phase(std::nullopt);
		m_text->set_scroll_phase(std::nullopt);
		m_scanline->set_sweep_phase(std::nullopt);
		// Only undo a multiplier the clock set; otherwise the CC value stands.
		if (m_wavelength_synced) {
			m_sinwave->set_wavelength_mult(1.0);
			m_wavelength_synced = false;
		}
		return;
	}

	if (!frame.running)
		return;

	if (frame.beat_edge) {
		const QVector<StarColour> palette = star_palette();
		const int pick = static_cast<int>(m_rng.bounded(static_cast<quint32>(palette.size())));
		m_starfield->set_spawn_colour(palette[pick]);
	}

	if (frame.text_scroll_px)
		m_text->set_scroll_phase(frame.text_scroll_px);
	if (frame.sweep_phase)
		m_scanline->set_sweep_phase(frame.sweep_phase);
	if (frame.wave_phase)
		m_sinwave->set_external_phase(frame.wave_phase);
	if (frame.wavelength_mult) {
		m_sinwave->set_wavelength_mult(*frame.wavelength_mult);
		m_wavelength_synced = true;
	}
}

void RenderLoop::switch_to(int rotation_index, double t)
{
	m_active = rotation_index;
	m_switch_started = t;
	m_rotation[m_active]->activate();

	psi_log(LOG_INFO, "Switched to: %s", qUtf8Printable(active_name()));
	emit effect_changed(active_name());
}

} // namespace psiwave
