#pragma once

// ============================================================================
// MIDI Decoder — turns raw MIDI bytes into typed events.
//
//   0xF8 / 0xFA / 0xFB / 0xFC   → ClockTracker (intercepted anywhere,
//                                 even between the bytes of another message)
//   0x9n / 0x8n                 → NoteEvent (NoteOn vel 0 = NoteOff)
//   0xBn                        → ControlChangeEvent
//
// System exclusive, system common and every other channel message is
// skipped. A message cut short by the end of the buffer is dropped.
// Running status is honoured within one buffer.
// ============================================================================

#include "../core/control_types.hpp"

#include <QByteArray>

namespace psiwave {

class ClockTracker;

class MidiDecoder {
public:
	explicit MidiDecoder(ClockTracker &clock);

	// Decode one buffer received at `now`. Appends to `ccs` / `notes`.
	void decode(const QByteArray &bytes, double now,
				ControlChangeBatch &ccs, NoteBatch &notes);

	// Messages dropped because they were truncated.
	int dropped_count() const { return m_dropped; }

private:
	void dispatch(int status, int data1, int data2, double now,
				  ControlChangeBatch &ccs, NoteBatch &notes);
	bool handle_realtime(int byte, double now);

	ClockTracker &m_clock;
	int m_dropped = 0;
};

} // namespace psiwave
