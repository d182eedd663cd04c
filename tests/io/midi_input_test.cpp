#include <catch2/catch.hpp>

#include "psiwave/io/midi_input.hpp"
#include "test_helpers/fake_midi_backend.hpp"

#include <memory>

using namespace psiwave;
using psiwave::test::FakeMidiBackend;

namespace {

MidiInputOptions no_wait(const QString &query = QString())
{
	MidiInputOptions o;
	o.port_query = query;
	o.retry_delays_ms = {0, 0, 0};
	return o;
}

} // namespace

TEST_CASE("psiwave/io/input/open", "[midi][input]")
{
	SECTION("null backend is disabled and drains nothing")
	{
		MidiInput input(nullptr, no_wait());
		REQUIRE_FALSE(input.is_enabled());
		REQUIRE(input.drain(1.0).isEmpty());
		REQUIRE(input.drain_notes().isEmpty());
		REQUIRE_FALSE(input.clock_state().running);
	}

	SECTION("opens the preferred port")
	{
		auto backend = std::make_unique<FakeMidiBackend>(
			QStringList{"Midi Through Port-0", "Keystation MIDI In"});
		FakeMidiBackend *fake = backend.get();
		MidiInput input(std::move(backend), no_wait());
		REQUIRE(input.is_enabled());
		REQUIRE(fake->open_index() == 1);
		REQUIRE(input.port_name() == "Keystation MIDI In");
	}

	SECTION("late ports are found by retrying")
	{
		auto backend = std::make_unique<FakeMidiBackend>();
		backend->set_empty_enumerations(3);
		FakeMidiBackend *fake = backend.get();
		MidiInput input(std::move(backend), no_wait());
		REQUIRE(input.is_enabled());
		REQUIRE(fake->enumerations() == 4);
	}

	SECTION("gives up after the last retry")
	{
		auto backend = std::make_unique<FakeMidiBackend>();
		backend->set_empty_enumerations(4);
		MidiInput input(std::move(backend), no_wait());
		REQUIRE_FALSE(input.is_enabled());
	}

	SECTION("a port that will not open disables the input")
	{
		auto backend = std::make_unique<FakeMidiBackend>();
		backend->set_fail_open(true);
		MidiInput input(std::move(backend), no_wait());
		REQUIRE_FALSE(input.is_enabled());
		REQUIRE(input.port_name().isEmpty());
	}
}

TEST_CASE("psiwave/io/input/drain", "[midi][input]")
{
	auto backend = std::make_unique<FakeMidiBackend>();
	FakeMidiBackend *fake = backend.get();
	MidiInput input(std::move(backend), no_wait());
	REQUIRE(input.is_enabled());

	SECTION("control changes are returned, notes are queued")
	{
		fake->push({0xB0, 101, 127});
		fake->push({0x90, 60, 90});
		fake->push({0xB1, 102, 0});

		const ControlChangeBatch ccs = input.drain(3.0);
		REQUIRE(ccs.size() == 2);
		REQUIRE(ccs[0].timestamp == 3.0);
		REQUIRE(ccs[1].channel == 2);
		REQUIRE(fake->pending() == 0);

		const NoteBatch notes = input.drain_notes();
		REQUIRE(notes.size() == 1);
		REQUIRE(notes[0].note == 60);
		REQUIRE(input.drain_notes().isEmpty());
	}

	SECTION("clock messages reach the tracker")
	{
		fake->push({0xFA});
		input.drain(0.0);
		const double dt = 60.0 / (120.0 * 24.0);
		for (int i = 0; i < 10; i++) {
			fake->push({0xF8});
			input.drain(i * dt);
		}
		REQUIRE(input.debug_state().tick_count == 10);

		const ClockState first = input.clock_state();
		REQUIRE(first.running);
		REQUIRE(first.start_pulse);
		REQUIRE(first.bpm);
		REQUIRE(*first.bpm == Approx(120.0).epsilon(0.01));
		REQUIRE_FALSE(input.clock_state().start_pulse);
	}

	SECTION("a throwing backend keeps earlier messages")
	{
		fake->push({0xB0, 5, 50});
		REQUIRE(input.drain(1.0).size() == 1);

		fake->set_throw_on_read(true);
		REQUIRE(input.drain(2.0).isEmpty());
		REQUIRE(input.drain(3.0).isEmpty());
		REQUIRE(input.is_enabled());
	}
}
