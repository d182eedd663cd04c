#include "unix_signal_watcher.hpp"

#include "utils/log_support.hpp"

#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace psiwave {

namespace {

int s_fds[2] = {-1, -1};	// [0] written by the handler, [1] read by Qt

} // namespace

UnixSignalWatcher::UnixSignalWatcher(QObject *parent)
	: QObject(parent)
{
	if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_fds) != 0) {
		psi_log(LOG_WARNING, "signal watcher: socketpair failed: %s",
			std::strerror(errno));
		s_fds[0] = s_fds[1] = -1;
		return;
	}

	m_notifier = new QSocketNotifier(s_fds[1], QSocketNotifier::Read, this);
	connect(m_notifier, &QSocketNotifier::activated,
		this, &UnixSignalWatcher::on_readable);

	std::signal(SIGINT, &UnixSignalWatcher::handle_signal);
	std::signal(SIGTERM, &UnixSignalWatcher::handle_signal);
}

UnixSignalWatcher::~UnixSignalWatcher()
{
	if (!m_notifier)
		return;

	std::signal(SIGINT, SIG_DFL);
	std::signal(SIGTERM, SIG_DFL);
	::close(s_fds[0]);
	::close(s_fds[1]);
	s_fds[0] = s_fds[1] = -1;
}

void UnixSignalWatcher::handle_signal(int signal_number)
{
	const char b = static_cast<char>(signal_number);
	if (s_fds[0] >= 0)
		(void)!::write(s_fds[0], &b, 1);
}

void UnixSignalWatcher::on_readable()
{
	m_notifier->setEnabled(false);
	char b = 0;
	const ssize_t n = ::read(s_fds[1], &b, 1);
	m_notifier->setEnabled(true);

	if (n == 1)
		emit interrupted(static_cast<int>(b));
}

} // namespace psiwave
