#pragma once

#include "effect.hpp"

#include <QVector>

#include <optional>

namespace psiwave {

// ---------------------------------------------------------------------------
// ScanlineNotesEffect — A playhead sweeps L→R→L once per cycle; each note
// draws a bar in its row from the phase it started at to the playhead.
// Released notes freeze and fade out.
//
// Rows are grouped into slots of kRowsPerSlot; note n lands in slot
// n % slot_count, the lowest slot at the bottom of the matrix.
// ---------------------------------------------------------------------------
class ScanlineNotesEffect : public Effect {
public:
	static constexpr int kRowsPerSlot = 2;
	static constexpr double kCycleSeconds = 4.0;	// Without clock sync
	static constexpr double kTrailSustain = 1.5;	// Fade after note-off, seconds

	struct Trail {
		double phase_on = 0.0;
		std::optional<double> t_off;		// Set on release
		std::optional<double> phase_off;	// Frozen bar end
		int channel = 1;
		int note = 0;
	};

	explicit ScanlineNotesEffect(bool verbose = false);

	void setup(const Matrix &matrix) override;
	void activate() override;
	void draw(Canvas &canvas, double t) override;
	void handle_note(const NoteEvent &note) override;

	// Bar phase from the clock; nullopt returns to the free-running cycle.
	void set_sweep_phase(std::optional<double> phase) { m_external_phase = phase; }

	int slot_count() const { return m_slot_count; }
	int rows_per_slot() const { return m_rows_per_slot; }
	const QVector<Trail> &trails(int slot) const { return m_slots[slot]; }

	double current_phase(double t) const;
	int phase_to_x(double phase) const;

	// Base colour for a MIDI channel (1-16).
	static Rgb channel_colour(int channel);

	// 1.0 for the first two pages of notes, then 0.25 less per page,
	// never below 0.2. A page is slot_count notes.
	double page_level(int note) const;

private:
	void layout();
	void draw_segment(Canvas &canvas, int x0, int x1, int y0, int y1,
					  const Rgb &c, double brightness);

	bool m_verbose;
	int m_slot_count = 0;
	int m_rows_per_slot = kRowsPerSlot;
	QVector<QVector<Trail>> m_slots;
	std::optional<double> m_external_phase;
	double m_last_t = 0.0;
};

} // namespace psiwave
