#include <catch2/catch.hpp>

#include "utils/midi/midi_backend.hpp"

TEST_CASE("psiwave/io/ports/score", "[midi][ports]")
{
	REQUIRE(MidiBackend::score_device("Scarlett MIDI In") == 110);
	REQUIRE(MidiBackend::score_device("Midi Through Port-0") == -100);
	REQUIRE(MidiBackend::score_device("USB Keyboard") == 15);
	REQUIRE(MidiBackend::score_device("loopMIDI") == 10);
}

TEST_CASE("psiwave/io/ports/pick", "[midi][ports]")
{
	const QStringList ports = {
		"Midi Through Port-0",
		"nanoKONTROL2 MIDI 1",
		"Arturia KeyStep USB MIDI In",
	};
	bool matched = false;

	SECTION("no ports")
	{
		REQUIRE(MidiBackend::pick_device({}, QString(), &matched) == -1);
	}

	SECTION("a query matches by case-insensitive substring")
	{
		REQUIRE(MidiBackend::pick_device(ports, "NANOKONTROL", &matched) == 1);
		REQUIRE(matched);
	}

	SECTION("an unmatched query falls back to the first port")
	{
		REQUIRE(MidiBackend::pick_device(ports, "launchpad", &matched) == 0);
		REQUIRE_FALSE(matched);
	}

	SECTION("without a query the best scoring port wins")
	{
		REQUIRE(MidiBackend::pick_device(ports, QString(), &matched) == 2);
		REQUIRE(matched);
	}

	SECTION("ties keep the earliest port")
	{
		REQUIRE(MidiBackend::pick_device({"Synth A", "Synth B"}, QString()) == 0);
	}

	SECTION("through ports lose to anything else")
	{
		REQUIRE(MidiBackend::pick_device({"Midi Through", "Other"}, QString()) == 1);
	}
}
