#include "rtmidi_backend.hpp"

#include "utils/log_support.hpp"

#include <RtMidi.h>

#include <vector>

namespace {

constexpr unsigned int kQueueSize = 1024;	// Room for ~20 s of clock at 120 BPM

} // namespace

RtMidiBackend::RtMidiBackend(QObject *parent)
	: MidiBackend(parent)
{
	try {
		m_midi = std::make_unique<RtMidiIn>(RtMidi::UNSPECIFIED,
			"psiwave", kQueueSize);
		// sysex, timing, active sensing
		m_midi->ignoreTypes(true, false, true);
	} catch (const RtMidiError &e) {
		psi_log(LOG_WARNING, "[midi] RtMidi: could not initialize MIDI input: %s",
			e.what());
		m_midi.reset();
	}
}

RtMidiBackend::~RtMidiBackend()
{
	RtMidiBackend::close_all();
}

QStringList RtMidiBackend::available_devices() const
{
	QStringList devices;
	if (!m_midi)
		return devices;

	try {
		const unsigned int count = m_midi->getPortCount();
		for (unsigned int i = 0; i < count; i++) {
			const std::string name = m_midi->getPortName(i);
			if (name.empty())
				devices.append(QString("MIDI Device %1").arg(i));
			else
				devices.append(QString::fromStdString(name));
		}
	} catch (const RtMidiError &e) {
		psi_log(LOG_WARNING, "[midi] RtMidi: could not list input ports: %s", e.what());
		devices.clear();
	}
	return devices;
}

bool RtMidiBackend::open_device(int index)
{
	if (!m_midi || index < 0)
		return false;
	if (m_open_index == index && m_midi->isPortOpen())
		return true;

	try {
		if (m_midi->isPortOpen())
			m_midi->closePort();
		m_midi->openPort(static_cast<unsigned int>(index), "psiwave input");
	} catch (const RtMidiError &e) {
		psi_log(LOG_WARNING, "[midi] RtMidi: failed to open MIDI device %d: %s",
			index, e.what());
		m_open_index = -1;
		return false;
	}

	m_open_index = index;
	psi_log(LOG_INFO, "[midi] RtMidi: opened MIDI input device %d", index);
	return true;
}

void RtMidiBackend::close_all()
{
	if (!m_midi)
		return;
	try {
		if (m_midi->isPortOpen())
			m_midi->closePort();
	} catch (const RtMidiError &e) {
		psi_log(LOG_WARNING, "[midi] RtMidi: error closing input: %s", e.what());
	}
	m_open_index = -1;
}

bool RtMidiBackend::is_open() const
{
	return m_midi && m_midi->isPortOpen();
}

bool RtMidiBackend::read_message(QByteArray &message)
{
	if (!m_midi)
		return false;

	std::vector<unsigned char> bytes;
	try {
		m_midi->getMessage(&bytes);
	} catch (const RtMidiError &e) {
		psi_log(LOG_WARNING, "[midi] RtMidi: poll failed: %s", e.what());
		return false;
	}

	if (bytes.empty())
		return false;

	message = QByteArray(reinterpret_cast<const char *>(bytes.data()),
		static_cast<int>(bytes.size()));
	return true;
}
