#include <catch2/catch.hpp>

#include "psiwave/core/parameter_set.hpp"

using namespace psiwave;

TEST_CASE("psiwave/core/parameters/declare_and_set", "[parameters]")
{
	ParameterSet params;
	params.declare("speed", 1.0);
	params.declare("color", 0.0);

	REQUIRE(params.size() == 2);
	REQUIRE(params.names() == QStringList({"speed", "color"}));
	REQUIRE(params.value("speed") == 1.0);

	SECTION("set updates a declared parameter")
	{
		REQUIRE(params.set("speed", 2.5));
		REQUIRE(params.value("speed") == 2.5);
		REQUIRE(params.value("color") == 0.0);
	}

	SECTION("unknown names are rejected and read as zero")
	{
		REQUIRE_FALSE(params.set("wavelength", 3.0));
		REQUIRE_FALSE(params.has("wavelength"));
		REQUIRE(params.value("wavelength") == 0.0);
	}

	SECTION("redeclaring keeps the position and resets the value")
	{
		params.set("speed", 3.0);
		params.declare("speed", 0.5);
		REQUIRE(params.size() == 2);
		REQUIRE(params.names().first() == "speed");
		REQUIRE(params.value("speed") == 0.5);
	}
}
