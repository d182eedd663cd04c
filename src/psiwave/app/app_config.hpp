#pragma once

// ============================================================================
// App Config — command line and binding-file settings for the demo runner.
// ============================================================================

#include "../core/cc_binding.hpp"
#include "../io/cc_router.hpp"
#include "../modules/time/clock_sync.hpp"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace psiwave {

enum class NoteLogMode {
	None,
	All,
};

std::optional<NoteLogMode> note_log_mode_from_name(const QString &name);
QString note_log_mode_name(NoteLogMode mode);

// Whether the wave-speed CC binding is built.
//   Auto  only when clock sync does not already drive the wave phase
enum class WaveSpeedMapping {
	Auto,
	On,
	Off,
};

std::optional<WaveSpeedMapping> wave_speed_mapping_from_name(const QString &name);
QString wave_speed_mapping_name(WaveSpeedMapping mode);

// Effect names accepted by --solo, in rotation order.
QStringList effect_names();

struct AppConfig {
	enum class ParseResult {
		Ok,
		Error,
		HelpRequested,
		VersionRequested,
	};

	// -- Demo selection --
	QString solo;					// Empty = rotate through every effect
	double switch_seconds = 30.0;

	// -- MIDI --
	QString midi_port;
	ClockSyncConfig sync;
	WaveSpeedMapping wave_speed_mapping = WaveSpeedMapping::Auto;
	CcRouter::LogMode midi_log = CcRouter::LogMode::None;
	NoteLogMode note_log = NoteLogMode::None;

	// -- Default CC assignments (negative = unbound) --
	int cc_wave_speed = -1;
	int cc_wave_wavelength = 102;
	int cc_wave_color = 108;
	int cc_wave_phase = -1;
	int cc_starfield_speed = 101;
	int cc_starfield_color = 102;
	int cc_text_speed = 101;
	int cc_text_color = 102;

	double starfield_color_threshold = 0.5;
	double starfield_color_steepness = 10.0;

	// -- Binding file; replaces the default CC assignments when set --
	QString bindings_file;
	QVector<CcBindingSpec> bindings;

	// -- Display --
	double target_fps = 60.0;		// <= 0 = uncapped
	int width = 80;
	int height = 40;
	int scale = 8;

	// Parse argv (including the program name). On Error, `error` holds the
	// message; `help_text` is filled for HelpRequested.
	static ParseResult parse(const QStringList &arguments, AppConfig &config,
							 QString *error = nullptr, QString *help_text = nullptr);

	// Reads `bindings_file` into `bindings`. False if the file is missing or
	// is not a binding document; bad entries are skipped into `warnings`.
	bool load_bindings(QString *error = nullptr, QStringList *warnings = nullptr);

	// {"bindings": [...]}. Bad entries are reported in `warnings` and skipped.
	static bool parse_bindings(const QByteArray &json, QVector<CcBindingSpec> &out,
							   QStringList *warnings = nullptr,
							   QString *error = nullptr);
};

} // namespace psiwave
