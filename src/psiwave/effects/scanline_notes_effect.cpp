#include "scanline_notes_effect.hpp"

#include "../render/canvas.hpp"
#include "utils/log_support.hpp"

#include <algorithm>
#include <cmath>

namespace psiwave {

namespace {

const Rgb kChannelColours[16] = {
	{255, 80, 80},		// 1: red
	{255, 160, 60},		// 2: orange
	{255, 220, 60},		// 3: amber
	{200, 255, 80},		// 4: lime
	{80, 255, 120},		// 5: green
	{60, 255, 200},		// 6: teal
	{60, 220, 255},		// 7: cyan
	{80, 140, 255},		// 8: sky blue
	{120, 100, 255},	// 9: blue-violet
	{200, 80, 255},		// 10: purple
	{255, 80, 200},		// 11: magenta
	{255, 100, 140},	// 12: pink
	{100, 100, 255},	// 13: periwinkle
	{200, 255, 100},	// 14: yellow-green
	{255, 100, 150},	// 15: rose
	{100, 200, 255},	// 16: light blue
};

const Rgb kPlayhead = {200, 255, 255};

double wrap01(double p)
{
	p = std::fmod(p, 1.0);
	return p < 0.0 ? p + 1.0 : p;
}

} // namespace

ScanlineNotesEffect::ScanlineNotesEffect(bool verbose)
	: Effect(QStringLiteral("scanline_notes"))
	, m_verbose(verbose)
{
}

void ScanlineNotesEffect::layout()
{
	m_rows_per_slot = kRowsPerSlot;
	m_slot_count = m_height / m_rows_per_slot;
	if (m_slot_count == 0) {
		m_slot_count = qMax(1, m_height);
		m_rows_per_slot = 1;
	}
	m_slots.clear();
	m_slots.resize(m_slot_count);
}

void ScanlineNotesEffect::setup(const Matrix &matrix)
{
	Effect::setup(matrix);
	layout();
	if (m_verbose) {
		psi_log(LOG_INFO, "[scanline] setup %dx%d, %d slots",
			m_width, m_height, m_slot_count);
	}
}

void ScanlineNotesEffect::activate()
{
	for (auto &slot : m_slots)
		slot.clear();
}

Rgb ScanlineNotesEffect::channel_colour(int channel)
{
	const int idx = ((channel - 1) % 16 + 16) % 16;
	return kChannelColours[idx];
}

double ScanlineNotesEffect::page_level(int note) const
{
	if (m_slot_count <= 0)
		return 1.0;
	const int page = note / m_slot_count;
	if (page <= 1)
		return 1.0;
	return std::max(0.2, 1.0 - (page - 1) * 0.25);
}

double ScanlineNotesEffect::current_phase(double t) const
{
	if (m_external_phase)
		return wrap01(*m_external_phase);
	return wrap01(t / kCycleSeconds);
}

int ScanlineNotesEffect::phase_to_x(double phase) const
{
	const double p = wrap01(phase);
	const int w = qMax(1, m_width - 1);
	// 0 → 0.5 sweeps left to right, 0.5 → 1 back
	if (p <= 0.5)
		return static_cast<int>(2.0 * p * w);
	return static_cast<int>(2.0 * (1.0 - p) * w);
}

void ScanlineNotesEffect::handle_note(const NoteEvent &note)
{
	if (m_slot_count <= 0 || note.note < 0 || note.note > kMaxControlValue)
		return;

	const bool is_on = note.is_on && note.velocity > 0;
	const int slot = note.note % m_slot_count;
	const double phase = current_phase(m_last_t);

	if (m_verbose) {
		psi_log(LOG_INFO, "[scanline] note %d (%s) ch=%d -> slot %d (phase %.3f)",
			note.note, is_on ? "ON" : "OFF", note.channel, slot, phase);
	}

	auto &trails = m_slots[slot];
	if (is_on) {
		Trail trail;
		trail.phase_on = phase;
		trail.channel = note.channel;
		trail.note = note.note;
		trails.append(trail);
		return;
	}

	// Release the oldest still-held trail in the slot.
	for (auto &trail : trails) {
		if (!trail.t_off) {
			trail.t_off = m_last_t;
			trail.phase_off = phase;
			return;
		}
	}

	if (m_verbose)
		psi_log(LOG_WARNING, "[scanline] note off for slot %d with no held note", slot);
}

void ScanlineNotesEffect::draw_segment(Canvas &canvas, int x0, int x1, int y0, int y1,
									   const Rgb &c, double brightness)
{
	int lo = std::min(x0, x1);
	int hi = std::max(x0, x1);
	lo = std::clamp(lo, 0, m_width - 1);
	hi = std::clamp(hi, 0, m_width - 1);
	const Rgb lit = dim(c, clamp01(brightness));

	for (int y = y0; y < y1; y++) {
		for (int x = lo; x <= hi; x++)
			canvas.set_pixel(x, y, lit.r, lit.g, lit.b);
	}
}

void ScanlineNotesEffect::draw(Canvas &canvas, double t)
{
	if (m_width != canvas.width() || m_height != canvas.height() || m_slots.isEmpty()) {
		m_width = canvas.width();
		m_height = canvas.height();
		layout();
	}

	m_last_t = t;
	canvas.clear();

	const double phase = current_phase(t);

	for (int s = 0; s < m_slot_count; s++) {
		auto &trails = m_slots[s];
		trails.erase(std::remove_if(trails.begin(), trails.end(),
			[t](const Trail &tr) {
				return tr.t_off && (t - *tr.t_off) >= kTrailSustain;
			}), trails.end());
		if (trails.isEmpty())
			continue;

		const int y0 = (m_slot_count - 1 - s) * m_rows_per_slot;
		const int y1 = std::min(y0 + m_rows_per_slot, m_height);

		// Lower notes first so higher notes end up in front.
		QVector<Trail> ordered = trails;
		std::stable_sort(ordered.begin(), ordered.end(),
			[](const Trail &a, const Trail &b) { return a.note < b.note; });

		for (const auto &tr : ordered) {
			double release = 1.0;
			if (tr.t_off)
				release = std::max(0.0, 1.0 - (t - *tr.t_off) / kTrailSustain);

			const double brightness = release * page_level(tr.note);
			const Rgb base = channel_colour(tr.channel);
			const double end_phase = tr.t_off ? *tr.phase_off : phase;

			const double span = wrap01(end_phase - tr.phase_on);
			if (span >= 0.5) {
				draw_segment(canvas, 0, m_width - 1, y0, y1, base, brightness);
				continue;
			}

			const int x_on = phase_to_x(tr.phase_on);
			const int x_end = phase_to_x(end_phase);
			const bool on_rising = wrap01(tr.phase_on) < 0.5;
			const bool end_rising = wrap01(end_phase) < 0.5;

			if (on_rising == end_rising) {
				draw_segment(canvas, x_on, x_end, y0, y1, base, brightness);
			} else {
				// Bounced off an edge once between the two phases.
				const int edge = on_rising ? m_width - 1 : 0;
				draw_segment(canvas, x_on, edge, y0, y1, base, brightness);
				draw_segment(canvas, edge, x_end, y0, y1, base, brightness);
			}
		}
	}

	const int x_scan = phase_to_x(phase);
	for (int y = 0; y < m_height; y++)
		canvas.set_pixel(x_scan, y, kPlayhead.r, kPlayhead.g, kPlayhead.b);
}

} // namespace psiwave
