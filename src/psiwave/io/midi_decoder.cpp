#include "midi_decoder.hpp"

#include "../modules/time/clock_tracker.hpp"

namespace psiwave {

namespace {

enum : int {
	kNoteOff		= 0x80,
	kNoteOn			= 0x90,
	kControlChange	= 0xB0,
	kProgramChange	= 0xC0,
	kChannelPressure= 0xD0,
	kSysexStart		= 0xF0,
	kSysexEnd		= 0xF7,
	kTimingClock	= 0xF8,
	kStart			= 0xFA,
	kContinue		= 0xFB,
	kStop			= 0xFC,
};

// Data bytes following `status`.
int data_length(int status)
{
	if (status < 0xF0) {
		const int type = status & 0xF0;
		return (type == kProgramChange || type == kChannelPressure) ? 1 : 2;
	}
	switch (status) {
	case 0xF1: return 1;	// MTC quarter frame
	case 0xF2: return 2;	// Song position pointer
	case 0xF3: return 1;	// Song select
	default:   return 0;
	}
}

} // namespace

MidiDecoder::MidiDecoder(ClockTracker &clock)
	: m_clock(clock)
{
}

bool MidiDecoder::handle_realtime(int byte, double now)
{
	switch (byte) {
	case kTimingClock:	m_clock.on_tick(now);		return true;
	case kStart:		m_clock.on_start();			return true;
	case kContinue:		m_clock.on_continue();		return true;
	case kStop:			m_clock.on_stop();			return true;
	default:			return byte >= kTimingClock;	// Active sensing, reset, undefined
	}
}

void MidiDecoder::decode(const QByteArray &bytes, double now,
						 ControlChangeBatch &ccs, NoteBatch &notes)
{
	int status = 0;			// 0 = no running status
	bool in_sysex = false;
	int data[2] = {0, 0};
	int have = 0;

	for (char c : bytes) {
		const int b = static_cast<unsigned char>(c);

		if (handle_realtime(b, now))
			continue;

		if (b == kSysexStart) {
			in_sysex = true;
			status = 0;
			have = 0;
			continue;
		}
		if (b == kSysexEnd) {
			in_sysex = false;
			continue;
		}

		if (b & 0x80) {
			// New status interrupts whatever was pending.
			if (have > 0)
				m_dropped++;
			in_sysex = false;
			status = b;
			have = 0;
			if (data_length(status) == 0)
				status = 0;
			continue;
		}

		if (in_sysex || status == 0)
			continue;

		data[have++] = b;
		if (have < data_length(status))
			continue;

		have = 0;
		if (status >= 0xF0) {
			// System common carries no running status.
			status = 0;
			continue;
		}
		dispatch(status, data[0], data[1], now, ccs, notes);
	}

	if (have > 0)
		m_dropped++;
}

void MidiDecoder::dispatch(int status, int data1, int data2, double now,
						   ControlChangeBatch &ccs, NoteBatch &notes)
{
	const int type = status & 0xF0;
	const int channel = (status & 0x0F) + 1;

	if (type == kNoteOn || type == kNoteOff) {
		NoteEvent n;
		n.channel = channel;
		n.note = data1 & 0x7F;
		n.velocity = data2 & 0x7F;
		n.is_on = type == kNoteOn && n.velocity > 0;
		n.timestamp = now;
		notes.append(n);
		return;
	}

	if (type == kControlChange) {
		ControlChangeEvent ev;
		ev.channel = channel;
		ev.control = data1 & 0x7F;
		ev.value = data2 & 0x7F;
		ev.timestamp = now;
		ccs.append(ev);
	}
}

} // namespace psiwave
