#pragma once

// ============================================================================
// MIDI Input — non-blocking, frame-polled MIDI source.
//
// Owns the backend, the decoder and the clock tracker. Without a usable
// backend the input is disabled and every drain returns nothing, so the
// render loop keeps running.
// ============================================================================

#include "midi_decoder.hpp"
#include "../core/control_types.hpp"
#include "../modules/time/clock_tracker.hpp"

#include <QString>
#include <QVector>
#include <QtGlobal>

#include <memory>

class MidiBackend;

namespace psiwave {

struct MidiInputOptions {
	QString port_query;						// Substring match; empty = auto
	QVector<int> retry_delays_ms = {600, 600, 1000};	// Between enumeration attempts
};

class MidiInput {
public:
	// `backend` may be null, which yields a disabled input.
	explicit MidiInput(std::unique_ptr<MidiBackend> backend,
					   const MidiInputOptions &options = MidiInputOptions());
	~MidiInput();

	bool is_enabled() const { return m_backend != nullptr; }
	const QString &port_name() const { return m_port_name; }

	// Pull every pending message. Clock bytes update the tracker, notes go
	// to the note queue, Control Changes are returned.
	ControlChangeBatch drain(double now);

	// Empties the note queue.
	NoteBatch drain_notes();

	// Consumes the start pulse.
	ClockState clock_state() { return m_clock.clock_state(); }
	ClockDebugState debug_state() const { return m_clock.debug_state(); }

	ClockTracker &clock() { return m_clock; }
	const MidiDecoder &decoder() const { return m_decoder; }

private:
	Q_DISABLE_COPY(MidiInput)

	void open(const MidiInputOptions &options);
	void disable(const char *reason);

	std::unique_ptr<MidiBackend> m_backend;
	QString m_port_name;
	ClockTracker m_clock;
	MidiDecoder m_decoder;
	NoteBatch m_notes;
	bool m_poll_error_logged = false;
};

} // namespace psiwave
