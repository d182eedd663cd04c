#include "midi_input.hpp"

#include "utils/log_support.hpp"
#include "utils/midi/midi_backend.hpp"

#include <QThread>

#include <exception>

namespace psiwave {

MidiInput::MidiInput(std::unique_ptr<MidiBackend> backend,
					 const MidiInputOptions &options)
	: m_backend(std::move(backend))
	, m_decoder(m_clock)
{
	open(options);
}

MidiInput::~MidiInput()
{
	if (m_backend)
		m_backend->close_all();
}

void MidiInput::disable(const char *reason)
{
	psi_log(LOG_WARNING, "[midi] disabled (%s)", reason);
	m_backend.reset();
}

void MidiInput::open(const MidiInputOptions &options)
{
	if (!m_backend) {
		psi_log(LOG_WARNING, "[midi] disabled (no MIDI backend)");
		return;
	}

	// Virtual drivers can register their ports late.
	QStringList ports;
	const int attempts = options.retry_delays_ms.size() + 1;
	for (int attempt = 0; attempt < attempts; attempt++) {
		ports = m_backend->available_devices();
		if (!ports.isEmpty())
			break;
		if (attempt < options.retry_delays_ms.size()) {
			const int delay = options.retry_delays_ms[attempt];
			if (delay > 0)
				QThread::msleep(static_cast<unsigned long>(delay));
		}
	}

	if (ports.isEmpty()) {
		disable("no MIDI input ports found");
		return;
	}

	bool matched = true;
	const int chosen = MidiBackend::pick_device(ports, options.port_query, &matched);
	if (!matched) {
		psi_log(LOG_WARNING, "[midi] port query '%s' not found; using first input instead",
			options.port_query.toUtf8().constData());
	}

	psi_log(LOG_INFO, "[midi] available inputs:");
	for (int i = 0; i < ports.size(); i++) {
		psi_log(LOG_INFO, "[midi]   %2d: %s%s", i, ports[i].toUtf8().constData(),
			i == chosen ? " <==" : "");
	}

	if (!m_backend->open_device(chosen)) {
		disable("could not open MIDI input port");
		return;
	}

	m_port_name = ports[chosen];
	psi_log(LOG_INFO, "[midi] listening on '%s', any channel (CC + clock)",
		m_port_name.toUtf8().constData());
}

ControlChangeBatch MidiInput::drain(double now)
{
	ControlChangeBatch out;
	if (!m_backend)
		return out;

	QByteArray message;
	try {
		while (m_backend->read_message(message)) {
			if (message.isEmpty())
				continue;
			m_decoder.decode(message, now, out, m_notes);
		}
	} catch (const std::exception &e) {
		// Keep what was decoded before the failure.
		if (!m_poll_error_logged) {
			m_poll_error_logged = true;
			psi_log(LOG_WARNING, "[midi] poll failed: %s", e.what());
		}
	}
	return out;
}

NoteBatch MidiInput::drain_notes()
{
	NoteBatch out;
	out.swap(m_notes);
	return out;
}

} // namespace psiwave
