#pragma once

#include <QObject>

class QSocketNotifier;

namespace psiwave {

// Turns SIGINT / SIGTERM into a Qt signal on the event loop thread.
// The handler only writes a byte to a socket pair; the notifier side
// emits interrupted(). One instance per process.
class UnixSignalWatcher : public QObject {
	Q_OBJECT

public:
	explicit UnixSignalWatcher(QObject *parent = nullptr);
	~UnixSignalWatcher() override;

	// False if the socket pair could not be created.
	bool is_active() const { return m_notifier != nullptr; }

signals:
	void interrupted(int signal_number);

private:
	static void handle_signal(int signal_number);
	void on_readable();

	QSocketNotifier *m_notifier = nullptr;
};

} // namespace psiwave
