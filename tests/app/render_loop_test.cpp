#include <catch2/catch.hpp>

#include "psiwave/app/render_loop.hpp"
#include "psiwave/effects/scanline_notes_effect.hpp"
#include "psiwave/effects/sinwave_effect.hpp"
#include "psiwave/effects/starfield_effect.hpp"
#include "psiwave/effects/text_scroll_effect.hpp"
#include "psiwave/io/cc_router.hpp"
#include "psiwave/io/midi_input.hpp"
#include "test_helpers/fake_midi_backend.hpp"
#include "test_helpers/offscreen_matrix.hpp"

#include <memory>

using namespace psiwave;
using psiwave::test::FakeMidiBackend;
using psiwave::test::OffscreenMatrix;

namespace {

constexpr double kInterval120 = 60.0 / (120.0 * 24.0);

MidiInputOptions no_wait()
{
	MidiInputOptions o;
	o.retry_delays_ms = {};
	return o;
}

// One loop wired to a scripted MIDI port and an offscreen matrix.
struct LoopFixture {
	explicit LoopFixture(const AppConfig &config = AppConfig())
	{
		auto backend = std::make_unique<FakeMidiBackend>();
		fake = backend.get();
		midi = std::make_unique<MidiInput>(std::move(backend), no_wait());
		loop = std::make_unique<RenderLoop>(config, *midi, router, matrix);
	}

	FakeMidiBackend *fake = nullptr;
	std::unique_ptr<MidiInput> midi;
	CcRouter router;
	OffscreenMatrix matrix;
	std::unique_ptr<RenderLoop> loop;
};

AppConfig solo(const QString &name)
{
	AppConfig c;
	c.solo = name;
	return c;
}

} // namespace

TEST_CASE("psiwave/app/loop/rotation", "[loop]")
{
	SECTION("every effect rotates in a fixed order")
	{
		LoopFixture f;
		REQUIRE(f.loop->rotation() == effect_names());
		REQUIRE(f.loop->targets().size() == 4);
	}

	SECTION("solo keeps one effect")
	{
		LoopFixture f(solo("text_scroll"));
		REQUIRE(f.loop->rotation() == QStringList({"text_scroll"}));
		REQUIRE(f.loop->targets().size() == 4);
	}
}

TEST_CASE("psiwave/app/loop/frames", "[loop]")
{
	AppConfig c;
	c.switch_seconds = 1.0;
	LoopFixture f(c);

	SECTION("each frame draws and swaps")
	{
		f.loop->run_frame(0.0);
		f.loop->run_frame(0.02);
		REQUIRE(f.matrix.swaps() == 2);
		REQUIRE(f.loop->frame_count() == 2);
		REQUIRE(f.matrix.front());
		REQUIRE(f.matrix.front()->lit_count() > 0);
	}

	SECTION("effects switch on the timer")
	{
		QStringList changes;
		QObject::connect(f.loop.get(), &RenderLoop::effect_changed,
			[&changes](const QString &name) { changes << name; });

		f.loop->run_frame(0.0);
		f.loop->run_frame(0.5);
		REQUIRE(f.loop->active_name() == "starfield");
		f.loop->run_frame(1.0);
		REQUIRE(f.loop->active_name() == "sinwave");
		REQUIRE(changes == QStringList({"sinwave"}));
	}

	SECTION("next restarts the switch timer")
	{
		f.loop->run_frame(0.0);
		f.loop->run_frame(0.9);
		f.loop->next();
		REQUIRE(f.loop->active_name() == "sinwave");

		f.loop->run_frame(1.5);
		REQUIRE(f.loop->active_name() == "sinwave");
		f.loop->run_frame(2.0);
		REQUIRE(f.loop->active_name() == "text_scroll");
	}

	SECTION("rotation wraps")
	{
		f.loop->run_frame(0.0);
		for (int i = 0; i < 4; i++)
			f.loop->next();
		REQUIRE(f.loop->active_name() == "starfield");
	}

	SECTION("stop blanks the display once")
	{
		int finished = 0;
		QObject::connect(f.loop.get(), &RenderLoop::finished, [&finished]() { finished++; });

		f.loop->run_frame(0.0);
		f.loop->stop();
		REQUIRE(finished == 1);
		REQUIRE(f.matrix.clears() == 1);
		REQUIRE_FALSE(f.loop->is_running());

		f.loop->stop();
		REQUIRE(finished == 1);
	}
}

TEST_CASE("psiwave/app/loop/midi", "[loop][midi]")
{
	SECTION("control changes reach effect parameters")
	{
		LoopFixture f;
		CcBindingSpec spec;
		spec.controls = {101};
		spec.target = "starfield";
		spec.param = "speed";
		spec.transform["kind"] = "linear";
		spec.transform["low"] = 0.5;
		spec.transform["high"] = 4.0;
		REQUIRE(build_bindings({spec}, f.loop->targets(), f.router) == 1);

		f.fake->push({0xB0, 101, 127});
		f.loop->run_frame(0.0);
		REQUIRE(f.loop->starfield().parameter("speed") == Approx(4.0));
	}

	SECTION("notes go to the active effect")
	{
		LoopFixture f(solo("scanline_notes"));
		f.loop->run_frame(0.0);

		f.fake->push({0x90, 0, 100});
		f.loop->run_frame(0.1);
		REQUIRE(f.loop->scanline().trails(0).size() == 1);

		f.fake->push({0x80, 0, 0});
		f.loop->run_frame(0.2);
		REQUIRE(f.loop->scanline().trails(0)[0].t_off);
	}

	SECTION("notes are not sent to inactive effects")
	{
		LoopFixture f;
		f.loop->run_frame(0.0);
		f.fake->push({0x90, 0, 100});
		f.loop->run_frame(0.1);
		REQUIRE(f.loop->scanline().trails(0).isEmpty());
	}
}

TEST_CASE("psiwave/app/loop/clock_sync", "[loop][sync]")
{
	AppConfig c;
	c.sync.mode = SyncMode::Both;
	c.sync.ref_bpm = 60.0;
	LoopFixture f(c);

	f.fake->push({0xFA});
	double t = 0.0;
	for (int i = 0; i < 48; i++) {
		f.fake->push({0xF8});
		f.loop->run_frame(t);
		t += kInterval120;
	}

	SECTION("running clock drives the effects")
	{
		REQUIRE(f.loop->sinwave().external_phase());
		REQUIRE(f.loop->sinwave().parameter("wavelength") == Approx(0.5));
		REQUIRE(f.loop->text_scroll().scroll_phase());
		REQUIRE(*f.loop->text_scroll().scroll_phase() == Approx(16.0));
		REQUIRE(f.loop->starfield().spawn_colour());
	}

	SECTION("stop releases every override")
	{
		f.fake->push({0xFC});
		f.loop->run_frame(t);
		REQUIRE_FALSE(f.loop->sinwave().external_phase());
		REQUIRE(f.loop->sinwave().parameter("wavelength") == 1.0);
		REQUIRE_FALSE(f.loop->text_scroll().scroll_phase());
	}
}

TEST_CASE("psiwave/app/loop/sync_off", "[loop][sync]")
{
	AppConfig c;
	c.sync.mode = SyncMode::Off;
	LoopFixture f(c);

	f.fake->push({0xFA});
	for (int i = 0; i < 30; i++) {
		f.fake->push({0xF8});
		f.loop->run_frame(i * kInterval120);
	}
	REQUIRE_FALSE(f.loop->sinwave().external_phase());
	REQUIRE_FALSE(f.loop->text_scroll().scroll_phase());
	REQUIRE(f.midi->debug_state().tick_count == 30);
}

TEST_CASE("psiwave/app/loop/wavelength_without_clock", "[loop][sync]")
{
	// Default config: speed sync on, no clock ever arrives.
	AppConfig c;
	LoopFixture f(c);
	REQUIRE(build_bindings(default_binding_specs(c), f.loop->targets(), f.router) > 0);

	SECTION("a CC value survives the frames after it")
	{
		f.fake->push({0xB0, 102, 127});
		f.loop->run_frame(0.0);
		REQUIRE(f.loop->sinwave().parameter("wavelength") == Approx(0.25));

		f.loop->run_frame(0.1);
		f.loop->run_frame(0.2);
		REQUIRE(f.loop->sinwave().parameter("wavelength") == Approx(0.25));
	}

	SECTION("a clock stop resets only a clock-set multiplier")
	{
		AppConfig spatial;
		spatial.sync.mode = SyncMode::Spatial;
		spatial.sync.ref_bpm = 60.0;
		LoopFixture g(spatial);
		REQUIRE(build_bindings(default_binding_specs(spatial), g.loop->targets(), g.router) > 0);

		g.fake->push({0xFA});
		double t = 0.0;
		for (int i = 0; i < 24; i++) {
			g.fake->push({0xF8});
			g.loop->run_frame(t);
			t += kInterval120;
		}
		REQUIRE(g.loop->sinwave().parameter("wavelength") == Approx(0.5));

		g.fake->push({0xFC});
		g.loop->run_frame(t);
		REQUIRE(g.loop->sinwave().parameter("wavelength") == 1.0);

		g.fake->push({0xB0, 102, 127});
		g.loop->run_frame(t + 0.1);
		g.loop->run_frame(t + 0.2);
		REQUIRE(g.loop->sinwave().parameter("wavelength") == Approx(0.25));
	}
}
