#include <catch2/catch.hpp>

#include "psiwave/io/midi_decoder.hpp"
#include "psiwave/modules/time/clock_tracker.hpp"

#include <initializer_list>

using namespace psiwave;

namespace {

QByteArray bytes(std::initializer_list<int> list)
{
	QByteArray out;
	for (int b : list)
		out.append(static_cast<char>(b));
	return out;
}

struct DecoderFixture {
	ClockTracker clock;
	MidiDecoder decoder{clock};
	ControlChangeBatch ccs;
	NoteBatch notes;

	void feed(std::initializer_list<int> list, double now = 1.0)
	{
		decoder.decode(bytes(list), now, ccs, notes);
	}
};

} // namespace

TEST_CASE_METHOD(DecoderFixture, "psiwave/io/decoder/channel_messages", "[decoder]")
{
	SECTION("control change")
	{
		feed({0xB3, 101, 64}, 2.5);
		REQUIRE(ccs.size() == 1);
		REQUIRE(ccs[0].channel == 4);
		REQUIRE(ccs[0].control == 101);
		REQUIRE(ccs[0].value == 64);
		REQUIRE(ccs[0].timestamp == 2.5);
	}

	SECTION("note on and off")
	{
		feed({0x90, 60, 100, 0x80, 60, 40});
		REQUIRE(notes.size() == 2);
		REQUIRE(notes[0].is_on);
		REQUIRE(notes[0].channel == 1);
		REQUIRE(notes[0].velocity == 100);
		REQUIRE_FALSE(notes[1].is_on);
	}

	SECTION("note on with zero velocity is a note off")
	{
		feed({0x95, 64, 0});
		REQUIRE(notes.size() == 1);
		REQUIRE_FALSE(notes[0].is_on);
		REQUIRE(notes[0].channel == 6);
	}

	SECTION("running status within one buffer")
	{
		feed({0xB0, 1, 10, 2, 20, 3, 30});
		REQUIRE(ccs.size() == 3);
		REQUIRE(ccs[2].control == 3);
		REQUIRE(ccs[2].value == 30);
	}

	SECTION("other channel messages are skipped")
	{
		feed({0xC0, 5, 0xD0, 80, 0xE0, 0, 64, 0xA0, 60, 10, 0xB0, 7, 100});
		REQUIRE(notes.isEmpty());
		REQUIRE(ccs.size() == 1);
		REQUIRE(ccs[0].control == 7);
	}
}

TEST_CASE_METHOD(DecoderFixture, "psiwave/io/decoder/realtime", "[decoder][clock]")
{
	SECTION("transport bytes drive the clock")
	{
		feed({0xFA});
		REQUIRE(clock.is_running());
		feed({0xF8}, 1.0);
		feed({0xF8}, 1.02);
		REQUIRE(clock.tick_count() == 2);
		feed({0xFC});
		REQUIRE_FALSE(clock.is_running());
		feed({0xFB});
		REQUIRE(clock.is_running());
	}

	SECTION("clock bytes inside a channel message do not break it")
	{
		feed({0xB0, 0xF8, 74, 0xF8, 99});
		REQUIRE(clock.tick_count() == 2);
		REQUIRE(ccs.size() == 1);
		REQUIRE(ccs[0].control == 74);
		REQUIRE(ccs[0].value == 99);
	}

	SECTION("active sensing is ignored")
	{
		feed({0xFE, 0xB0, 1, 2, 0xFE});
		REQUIRE(ccs.size() == 1);
		REQUIRE(decoder.dropped_count() == 0);
	}
}

TEST_CASE_METHOD(DecoderFixture, "psiwave/io/decoder/malformed", "[decoder]")
{
	SECTION("truncated message is dropped")
	{
		feed({0xB0, 7});
		REQUIRE(ccs.isEmpty());
		REQUIRE(decoder.dropped_count() == 1);
	}

	SECTION("a new status interrupts a pending message")
	{
		feed({0x90, 60, 0xB0, 1, 2});
		REQUIRE(notes.isEmpty());
		REQUIRE(ccs.size() == 1);
		REQUIRE(decoder.dropped_count() == 1);
	}

	SECTION("sysex is skipped")
	{
		feed({0xF0, 0x7E, 0x01, 0x02, 0xF7, 0xB0, 10, 20});
		REQUIRE(ccs.size() == 1);
		REQUIRE(ccs[0].control == 10);
	}

	SECTION("system common cancels running status")
	{
		feed({0xB0, 1, 2, 0xF2, 0, 0, 3, 4});
		REQUIRE(ccs.size() == 1);
	}

	SECTION("stray data bytes are ignored")
	{
		feed({10, 20, 30});
		REQUIRE(ccs.isEmpty());
		REQUIRE(notes.isEmpty());
	}

	SECTION("running status does not carry across buffers")
	{
		feed({0xB0, 1, 2});
		feed({3, 4});
		REQUIRE(ccs.size() == 1);
	}
}
