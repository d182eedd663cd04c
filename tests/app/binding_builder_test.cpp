#include <catch2/catch.hpp>

#include "psiwave/app/binding_builder.hpp"
#include "psiwave/io/cc_router.hpp"
#include "test_helpers/recording_sink.hpp"

using namespace psiwave;
using psiwave::test::RecordingSink;

namespace {

ControlChangeEvent cc(int control, int value)
{
	ControlChangeEvent ev;
	ev.control = control;
	ev.value = value;
	ev.timestamp = 1.0;
	return ev;
}

const CcBindingSpec *find(const QVector<CcBindingSpec> &specs,
						  const QString &target, const QString &param)
{
	for (const auto &s : specs) {
		if (s.target == target && s.param == param)
			return &s;
	}
	return nullptr;
}

} // namespace

TEST_CASE("psiwave/app/bindings/clamp", "[bindings]")
{
	REQUIRE(clamp_cc(-1) == -1);
	REQUIRE(clamp_cc(64) == 64);
	REQUIRE(clamp_cc(200) == 127);
}

TEST_CASE("psiwave/app/bindings/wave_speed_mapping", "[bindings]")
{
	REQUIRE_FALSE(wave_speed_binding_enabled(WaveSpeedMapping::Auto, SyncMode::Speed));
	REQUIRE_FALSE(wave_speed_binding_enabled(WaveSpeedMapping::Auto, SyncMode::Both));
	REQUIRE(wave_speed_binding_enabled(WaveSpeedMapping::Auto, SyncMode::Spatial));
	REQUIRE(wave_speed_binding_enabled(WaveSpeedMapping::Auto, SyncMode::Off));
	REQUIRE(wave_speed_binding_enabled(WaveSpeedMapping::On, SyncMode::Speed));
	REQUIRE_FALSE(wave_speed_binding_enabled(WaveSpeedMapping::Off, SyncMode::Off));
}

TEST_CASE("psiwave/app/bindings/defaults", "[bindings]")
{
	AppConfig c;

	SECTION("unbound controls are skipped")
	{
		const auto specs = default_binding_specs(c);
		REQUIRE(specs.size() == 6);
		REQUIRE_FALSE(find(specs, "sinwave", "speed"));
		REQUIRE_FALSE(find(specs, "sinwave", "phase_offset"));
		REQUIRE(find(specs, "sinwave", "wavelength")->controls == QVector<int>({102}));
		REQUIRE(find(specs, "starfield", "color_amount")->transform["kind"].toString() == "sigmoid");
	}

	SECTION("wave speed appears when sync does not drive it")
	{
		c.cc_wave_speed = 20;
		c.sync.mode = SyncMode::Off;
		REQUIRE(find(default_binding_specs(c), "sinwave", "speed"));
		c.sync.mode = SyncMode::Speed;
		REQUIRE_FALSE(find(default_binding_specs(c), "sinwave", "speed"));
	}

	SECTION("out of range numbers clamp and thresholds clamp")
	{
		c.cc_text_color = 500;
		c.starfield_color_threshold = 3.0;
		const auto specs = default_binding_specs(c);
		REQUIRE(find(specs, "text_scroll", "color")->controls == QVector<int>({127}));
		REQUIRE(find(specs, "starfield", "color_amount")->transform["threshold"].toDouble() == 1.0);
	}

	SECTION("every default spec validates")
	{
		c.cc_wave_speed = 1;
		c.cc_wave_phase = 2;
		c.sync.mode = SyncMode::Off;
		const auto specs = default_binding_specs(c);
		REQUIRE(specs.size() == 8);
		for (const auto &s : specs)
			REQUIRE(s.validate());
	}
}

TEST_CASE("psiwave/app/bindings/build", "[bindings]")
{
	RecordingSink wave;
	RecordingSink stars;
	RecordingSink text;
	const BindingTargets targets = {
		{"sinwave", &wave}, {"starfield", &stars}, {"text_scroll", &text}};

	SECTION("defaults share CC 101 and 102 between effects")
	{
		AppConfig c;
		CcRouter router;
		QStringList warnings;
		REQUIRE(build_bindings(default_binding_specs(c), targets, router, &warnings) == 6);
		REQUIRE(warnings.isEmpty());

		router.process({cc(101, 127)});
		REQUIRE(stars.last("speed") == Approx(4.0));
		REQUIRE(text.last("speed") == Approx(2.0));

		router.process({cc(102, 0)});
		REQUIRE(wave.last("wavelength") == Approx(1.0));
		REQUIRE(stars.last("color_amount") == 0.0);
		REQUIRE(text.last("color") == 0.0);

		router.process({cc(108, 127)});
		REQUIRE(wave.last("color") == Approx(127.0));
	}

	SECTION("unknown targets are reported and skipped")
	{
		CcBindingSpec ok;
		ok.controls = {1};
		ok.target = "sinwave";
		ok.param = "speed";

		CcBindingSpec bad = ok;
		bad.target = "plasma";

		CcRouter router;
		QStringList warnings;
		REQUIRE(build_bindings({ok, bad}, targets, router, &warnings) == 1);
		REQUIRE(router.binding_count() == 1);
		REQUIRE(warnings.size() == 1);
		REQUIRE(warnings[0].contains("plasma"));
	}

	SECTION("strategy and transform come from the spec")
	{
		CcBindingSpec s;
		s.controls = {9, 10};
		s.target = "starfield";
		s.param = "speed";
		s.strategy = "average_of_last_per_channel";
		s.transform["kind"] = "raw";

		const auto binding = make_binding(s, targets);
		REQUIRE(binding);
		REQUIRE(binding->target() == &stars);
		REQUIRE(binding->target_name() == "starfield");
		REQUIRE(binding->transform().name() == "RawCC");
		REQUIRE(binding->resolver().strategy().kind() ==
			ResolveStrategy::Kind::AverageOfLastPerChannel);
	}
}
