#include "app_config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <vector>

namespace psiwave {

std::optional<NoteLogMode> note_log_mode_from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n == "none")
		return NoteLogMode::None;
	if (n == "all")
		return NoteLogMode::All;
	return std::nullopt;
}

QString note_log_mode_name(NoteLogMode mode)
{
	return mode == NoteLogMode::All ? QStringLiteral("all") : QStringLiteral("none");
}

std::optional<WaveSpeedMapping> wave_speed_mapping_from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n == "auto")
		return WaveSpeedMapping::Auto;
	if (n == "on")
		return WaveSpeedMapping::On;
	if (n == "off")
		return WaveSpeedMapping::Off;
	return std::nullopt;
}

QString wave_speed_mapping_name(WaveSpeedMapping mode)
{
	switch (mode) {
	case WaveSpeedMapping::Auto:	return QStringLiteral("auto");
	case WaveSpeedMapping::On:		return QStringLiteral("on");
	case WaveSpeedMapping::Off:		return QStringLiteral("off");
	}
	return QStringLiteral("auto");
}

QStringList effect_names()
{
	return {QStringLiteral("starfield"), QStringLiteral("sinwave"),
			QStringLiteral("text_scroll"), QStringLiteral("scanline_notes")};
}

// ===== Command line =======================================================

namespace {

struct NumberOption {
	QCommandLineOption option;
	double *target_d;
	int *target_i;
};

bool fail(QString *error, const QString &msg)
{
	if (error)
		*error = msg;
	return false;
}

} // namespace

AppConfig::ParseResult AppConfig::parse(const QStringList &arguments, AppConfig &c,
										QString *error, QString *help_text)
{
	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("psiwave LED matrix demos"));
	const QCommandLineOption help_opt = parser.addHelpOption();
	const QCommandLineOption version_opt = parser.addVersionOption();

	const QCommandLineOption solo_opt("solo",
		QStringLiteral("Run only one demo: %1.").arg(effect_names().join(", ")), "name");
	const QCommandLineOption port_opt("midi-port",
		"MIDI input port name (substring match).", "name");
	const QCommandLineOption sync_opt("midi-sync",
		"Sync wave parameters to MIDI clock: off|wavelength|speed|spatial|both "
		"(default speed). 'wavelength' is an alias for 'speed'.", "mode", "speed");
	const QCommandLineOption sync_log_opt("midi-sync-log",
		"Log MIDI clock status: none|bpm|clock.", "mode", "none");
	const QCommandLineOption wave_speed_opt("wave-speed-cc-mapping",
		"Wave-speed CC mapping: auto|on|off. 'auto' disables it when "
		"--midi-sync is speed or both.", "mode", "auto");
	const QCommandLineOption midi_log_opt("midi-log",
		"MIDI CC logging: mapped|all|both|none.", "mode", "none");
	const QCommandLineOption note_log_opt("midi-note-log",
		"MIDI note logging: none|all.", "mode", "none");
	const QCommandLineOption bindings_opt("bindings",
		"JSON file of CC bindings replacing the --cc-* assignments.", "file");

	parser.addOption(solo_opt);
	parser.addOption(port_opt);
	parser.addOption(sync_opt);
	parser.addOption(sync_log_opt);
	parser.addOption(wave_speed_opt);
	parser.addOption(midi_log_opt);
	parser.addOption(note_log_opt);
	parser.addOption(bindings_opt);

	const AppConfig defaults;
	auto num = [](const char *name, const char *desc, double def) {
		return QCommandLineOption(name, desc, "value", QString::number(def));
	};

	const std::vector<NumberOption> numbers = {
		{num("midi-sync-ref-bpm", "Reference BPM for wavelength mapping.", defaults.sync.ref_bpm), &c.sync.ref_bpm, nullptr},
		{num("midi-sync-wavelength-min", "Min wavelength multiplier when syncing.", defaults.sync.wavelength_min), &c.sync.wavelength_min, nullptr},
		{num("midi-sync-wavelength-max", "Max wavelength multiplier when syncing.", defaults.sync.wavelength_max), &c.sync.wavelength_max, nullptr},
		{num("midi-sync-beats-per-cycle", "Beats per full 2pi cycle for speed sync.", defaults.sync.beats_per_cycle), &c.sync.beats_per_cycle, nullptr},
		{num("cc-wave-speed", "CC number for wave speed.", defaults.cc_wave_speed), nullptr, &c.cc_wave_speed},
		{num("cc-wave-wavelength", "CC number for wave wavelength.", defaults.cc_wave_wavelength), nullptr, &c.cc_wave_wavelength},
		{num("cc-wave-color", "CC number for wave colour.", defaults.cc_wave_color), nullptr, &c.cc_wave_color},
		{num("cc-wave-phase", "CC number for wave phase.", defaults.cc_wave_phase), nullptr, &c.cc_wave_phase},
		{num("cc-starfield-speed", "CC number for starfield speed.", defaults.cc_starfield_speed), nullptr, &c.cc_starfield_speed},
		{num("cc-starfield-color", "CC number for starfield colour.", defaults.cc_starfield_color), nullptr, &c.cc_starfield_color},
		{num("cc-text-speed", "CC number for text scroll speed.", defaults.cc_text_speed), nullptr, &c.cc_text_speed},
		{num("cc-text-color", "CC number for text colour.", defaults.cc_text_color), nullptr, &c.cc_text_color},
		{num("starfield-color-threshold", "Sigmoid threshold for starfield colour.", defaults.starfield_color_threshold), &c.starfield_color_threshold, nullptr},
		{num("starfield-color-steepness", "Sigmoid steepness for starfield colour.", defaults.starfield_color_steepness), &c.starfield_color_steepness, nullptr},
		{num("target-fps", "Target frame rate cap (0 = uncapped).", defaults.target_fps), &c.target_fps, nullptr},
		{num("switch-seconds", "Seconds before switching to the next demo.", defaults.switch_seconds), &c.switch_seconds, nullptr},
		{num("width", "Matrix width in LEDs.", defaults.width), nullptr, &c.width},
		{num("height", "Matrix height in LEDs.", defaults.height), nullptr, &c.height},
		{num("scale", "Screen pixels per LED.", defaults.scale), nullptr, &c.scale},
	};
	for (const auto &n : numbers)
		parser.addOption(n.option);

	if (!parser.parse(arguments)) {
		fail(error, parser.errorText());
		return ParseResult::Error;
	}
	if (parser.isSet(help_opt)) {
		if (help_text)
			*help_text = parser.helpText();
		return ParseResult::HelpRequested;
	}
	if (parser.isSet(version_opt))
		return ParseResult::VersionRequested;

	if (!parser.positionalArguments().isEmpty()) {
		fail(error, QStringLiteral("unexpected argument '%1'")
			.arg(parser.positionalArguments().first()));
		return ParseResult::Error;
	}

	if (parser.isSet(solo_opt)) {
		c.solo = parser.value(solo_opt).trimmed().toLower();
		if (!effect_names().contains(c.solo)) {
			fail(error, QStringLiteral("unknown demo '%1' (expected one of %2)")
				.arg(c.solo, effect_names().join(", ")));
			return ParseResult::Error;
		}
	}

	c.midi_port = parser.value(port_opt);
	c.bindings_file = parser.value(bindings_opt);

	const auto sync = sync_mode_from_name(parser.value(sync_opt));
	const auto sync_log = clock_log_mode_from_name(parser.value(sync_log_opt));
	const auto wave_speed = wave_speed_mapping_from_name(parser.value(wave_speed_opt));
	const auto midi_log = CcRouter::log_mode_from_name(parser.value(midi_log_opt));
	const auto note_log = note_log_mode_from_name(parser.value(note_log_opt));

	if (!sync) {
		fail(error, QStringLiteral("invalid --midi-sync '%1'").arg(parser.value(sync_opt)));
		return ParseResult::Error;
	}
	if (!sync_log) {
		fail(error, QStringLiteral("invalid --midi-sync-log '%1'").arg(parser.value(sync_log_opt)));
		return ParseResult::Error;
	}
	if (!wave_speed) {
		fail(error, QStringLiteral("invalid --wave-speed-cc-mapping '%1'").arg(parser.value(wave_speed_opt)));
		return ParseResult::Error;
	}
	if (!midi_log) {
		fail(error, QStringLiteral("invalid --midi-log '%1'").arg(parser.value(midi_log_opt)));
		return ParseResult::Error;
	}
	if (!note_log) {
		fail(error, QStringLiteral("invalid --midi-note-log '%1'").arg(parser.value(note_log_opt)));
		return ParseResult::Error;
	}

	c.sync.mode = *sync;
	c.sync.log_mode = *sync_log;
	c.wave_speed_mapping = *wave_speed;
	c.midi_log = *midi_log;
	c.note_log = *note_log;

	for (const auto &n : numbers) {
		const QString name = n.option.names().first();
		const QString text = parser.value(n.option);
		bool ok = false;
		if (n.target_i) {
			const int v = text.toInt(&ok);
			if (ok)
				*n.target_i = v;
		} else {
			const double v = text.toDouble(&ok);
			if (ok)
				*n.target_d = v;
		}
		if (!ok) {
			fail(error, QStringLiteral("invalid --%1 '%2'").arg(name, text));
			return ParseResult::Error;
		}
	}

	if (c.width <= 0 || c.height <= 0 || c.scale <= 0) {
		fail(error, QStringLiteral("--width, --height and --scale must be positive"));
		return ParseResult::Error;
	}

	return ParseResult::Ok;
}

// ===== Binding file =======================================================

bool AppConfig::parse_bindings(const QByteArray &json, QVector<CcBindingSpec> &out,
							   QStringList *warnings, QString *error)
{
	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
	if (doc.isNull())
		return fail(error, QStringLiteral("invalid JSON: %1").arg(perr.errorString()));

	QJsonArray entries;
	if (doc.isArray()) {
		entries = doc.array();
	} else if (doc.isObject() && doc.object()["bindings"].isArray()) {
		entries = doc.object()["bindings"].toArray();
	} else {
		return fail(error, QStringLiteral("expected {\"bindings\": [...]}"));
	}

	out.clear();
	for (int i = 0; i < entries.size(); i++) {
		if (!entries[i].isObject()) {
			if (warnings)
				warnings->append(QStringLiteral("binding %1: not an object").arg(i));
			continue;
		}

		const CcBindingSpec spec = CcBindingSpec::from_json(entries[i].toObject());
		QString why;
		if (!spec.validate(&why)) {
			if (warnings)
				warnings->append(QStringLiteral("binding %1: %2").arg(i).arg(why));
			continue;
		}
		out.append(spec);
	}
	return true;
}

bool AppConfig::load_bindings(QString *error, QStringList *warnings)
{
	if (bindings_file.isEmpty())
		return true;

	QFile file(bindings_file);
	if (!file.open(QIODevice::ReadOnly))
		return fail(error, QStringLiteral("cannot read %1: %2")
			.arg(bindings_file, file.errorString()));

	QString why;
	if (!parse_bindings(file.readAll(), bindings, warnings, &why))
		return fail(error, QStringLiteral("%1: %2").arg(bindings_file, why));
	return true;
}

} // namespace psiwave
