#pragma once

#include "midi_backend.hpp"

#include <memory>

class RtMidiIn;

// MidiBackend on top of RtMidi (ALSA / JACK / CoreMIDI / WinMM).
// RtMidi queues incoming messages on its own thread; read_message() pops
// that queue without blocking. Sysex and active sensing are filtered out
// at the source, timing messages are kept.
class RtMidiBackend : public MidiBackend {
	Q_OBJECT

public:
	explicit RtMidiBackend(QObject *parent = nullptr);
	~RtMidiBackend() override;

	// False if RtMidi could not create an input client.
	bool is_valid() const { return m_midi != nullptr; }

	QStringList available_devices() const override;
	bool open_device(int index) override;
	void close_all() override;
	bool is_open() const override;
	bool read_message(QByteArray &message) override;

private:
	std::unique_ptr<RtMidiIn> m_midi;
	int m_open_index = -1;
};
