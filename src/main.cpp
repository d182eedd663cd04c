#include "psiwave/app/app_config.hpp"
#include "psiwave/app/binding_builder.hpp"
#include "psiwave/app/render_loop.hpp"
#include "psiwave/app/unix_signal_watcher.hpp"
#include "psiwave/io/cc_router.hpp"
#include "psiwave/io/midi_input.hpp"
#include "psiwave/ui/matrix_window.hpp"
#include "utils/log_support.hpp"
#include "utils/midi/rtmidi_backend.hpp"

#include <QApplication>

#include <cstdio>
#include <memory>

using namespace psiwave;

int main(int argc, char *argv[])
{
	QApplication app(argc, argv);
	QApplication::setApplicationName(QString::fromLatin1(PSIWAVE_NAME));
	QApplication::setApplicationVersion(QString::fromLatin1(PSIWAVE_VERSION));

	AppConfig config;
	QString error;
	QString help;
	switch (AppConfig::parse(QApplication::arguments(), config, &error, &help)) {
	case AppConfig::ParseResult::Ok:
		break;
	case AppConfig::ParseResult::HelpRequested:
		std::fputs(qUtf8Printable(help), stdout);
		return 0;
	case AppConfig::ParseResult::VersionRequested:
		std::printf("%s %s\n", PSIWAVE_NAME, PSIWAVE_VERSION);
		return 0;
	case AppConfig::ParseResult::Error:
		std::fprintf(stderr, "%s: %s\n", PSIWAVE_NAME, qUtf8Printable(error));
		return 1;
	}

	if (!config.bindings_file.isEmpty()) {
		QStringList warnings;
		if (!config.load_bindings(&error, &warnings)) {
			psi_log(LOG_ERROR, "%s", qUtf8Printable(error));
			return 1;
		}
		for (const QString &w : warnings)
			psi_log(LOG_WARNING, "[midi] %s", qUtf8Printable(w));
	}

	// -- Display --
	ScreenMatrix matrix(config.width, config.height, config.scale);

	// -- MIDI --
	auto backend = std::make_unique<RtMidiBackend>();
	if (!backend->is_valid())
		backend.reset();
	MidiInputOptions midi_options;
	midi_options.port_query = config.midi_port;
	MidiInput midi(std::move(backend), midi_options);

	// -- Routing --
	CcRouter router(config.midi_log);
	RenderLoop loop(config, midi, router, matrix);

	const QVector<CcBindingSpec> specs = config.bindings_file.isEmpty()
		? default_binding_specs(config)
		: config.bindings;
	QStringList warnings;
	build_bindings(specs, loop.targets(), router, &warnings);
	for (const QString &w : warnings)
		psi_log(LOG_WARNING, "[midi] %s", qUtf8Printable(w));

	if (config.sync.mode != SyncMode::Off)
		psi_log(LOG_INFO, "[midi] Sync mode: %s (debug: --midi-sync-log clock or bpm)",
			qUtf8Printable(sync_mode_name(config.sync.mode)));
	psi_log(LOG_INFO, "[midi] CC bindings: %s", qUtf8Printable(router.describe()));
	psi_log(LOG_INFO, "[midi] log=%s note_log=%s sync_log=%s",
		qUtf8Printable(CcRouter::log_mode_name(config.midi_log)),
		qUtf8Printable(note_log_mode_name(config.note_log)),
		qUtf8Printable(clock_log_mode_name(config.sync.log_mode)));

	// -- Shutdown paths --
	UnixSignalWatcher signal_watcher;
	QObject::connect(&signal_watcher, &UnixSignalWatcher::interrupted,
		&loop, [&loop](int) { loop.stop(); });
	QObject::connect(&matrix, &ScreenMatrix::closed, &loop, &RenderLoop::stop);
	QObject::connect(&matrix, &ScreenMatrix::next_requested, &loop, &RenderLoop::next);
	QObject::connect(&loop, &RenderLoop::finished, &app, &QApplication::quit);

	matrix.show();
	loop.start();

	return app.exec();
}
