#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>

// Abstract MIDI input backend.
// Subclass this to add support for different MIDI APIs (RtMidi, test fakes, etc.)
// Input is polled: the backend buffers incoming messages and the render
// loop drains them once per frame.
class MidiBackend : public QObject {
	Q_OBJECT

public:
	explicit MidiBackend(QObject *parent = nullptr) : QObject(parent) {}
	~MidiBackend() override = default;

	// Enumerate available MIDI input devices
	virtual QStringList available_devices() const = 0;

	// Open a device by index. Returns true on success.
	virtual bool open_device(int index) = 0;

	// Close all open input devices
	virtual void close_all() = 0;

	virtual bool is_open() const = 0;

	// Pop the oldest buffered message (one or more raw MIDI bytes).
	// Returns false when nothing is pending. Never blocks.
	virtual bool read_message(QByteArray &message) = 0;

	// --- Device selection ---

	// Heuristic preference for a port name when no query is given:
	// "midi in" ports beat everything, "through" ports lose.
	static int score_device(const QString &name);

	// Index of the port to open, or -1 if `devices` is empty.
	// A non-empty query picks the first case-insensitive substring match;
	// if nothing matches, the first port is used and `query_matched` is
	// set to false. Without a query the highest score wins, earliest first.
	static int pick_device(const QStringList &devices, const QString &query,
						   bool *query_matched = nullptr);
};
