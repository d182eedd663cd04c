#pragma once

// ============================================================================
// psiwave control core — Core Types
// Immutable MIDI events and the unit-interval helpers shared by the
// transform, resolver and router layers.
// ============================================================================

#include <QString>
#include <QVector>

namespace psiwave {

// ---------------------------------------------------------------------------
// MIDI constants
// ---------------------------------------------------------------------------
constexpr int kMidiClockPpqn = 24;	// Pulses per quarter note
constexpr int kBeatsPerBar = 4;
constexpr int kMaxControlValue = 127;

// ---------------------------------------------------------------------------
// ControlChangeEvent — One received Control Change message.
// ---------------------------------------------------------------------------
struct ControlChangeEvent {
	int channel = 1;		// 1-16
	int control = 0;		// 0-127
	int value = 0;			// 0-127
	double timestamp = 0.0;	// Seconds since process start
};

// ---------------------------------------------------------------------------
// NoteEvent — One received NoteOn / NoteOff message.
// NoteOn with velocity 0 is delivered as is_on == false.
// ---------------------------------------------------------------------------
struct NoteEvent {
	int channel = 1;		// 1-16
	int note = 0;			// 0-127
	int velocity = 0;		// 0-127
	bool is_on = false;
	double timestamp = 0.0;
};

using ControlChangeBatch = QVector<ControlChangeEvent>;
using NoteBatch = QVector<NoteEvent>;

// ---------------------------------------------------------------------------
// Unit-interval helpers
// ---------------------------------------------------------------------------
inline double clamp01(double x)
{
	if (x <= 0.0)
		return 0.0;
	if (x >= 1.0)
		return 1.0;
	return x;
}

// Raw control byte (0..127) to 0..1, saturating at both ends.
inline double cc_unit(int value)
{
	if (value <= 0)
		return 0.0;
	if (value >= kMaxControlValue)
		return 1.0;
	return static_cast<double>(value) / kMaxControlValue;
}

inline double lerp(double a, double b, double t)
{
	return a + (b - a) * t;
}

} // namespace psiwave
