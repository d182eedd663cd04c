#include <catch2/catch.hpp>

#include "psiwave/core/control_transforms.hpp"

#include <QJsonObject>

using namespace psiwave;

TEST_CASE("psiwave/core/transforms/sigmoid01", "[transforms]")
{
	SECTION("endpoints are exact")
	{
		for (double k : {0.5, 1.0, 10.0, 200.0}) {
			for (double thr : {0.0, 0.25, 0.5, 0.9}) {
				REQUIRE(sigmoid01(0.0, thr, k) == 0.0);
				REQUIRE(sigmoid01(1.0, thr, k) == 1.0);
			}
		}
	}

	SECTION("crosses one half at the threshold")
	{
		REQUIRE(sigmoid01(0.5, 0.5, 10.0) == Approx(0.5));
		REQUIRE(sigmoid01(0.3, 0.3, 25.0) == Approx(0.5));
	}

	SECTION("monotonic inside the interval")
	{
		double prev = 0.0;
		for (int i = 1; i < 100; i++) {
			const double y = sigmoid01(i / 100.0, 0.5, 10.0);
			REQUIRE(y >= prev);
			prev = y;
		}
	}

	SECTION("non-positive steepness is linear")
	{
		REQUIRE(sigmoid01(0.3, 0.5, 0.0) == Approx(0.3));
		REQUIRE(sigmoid01(0.7, 0.5, -4.0) == Approx(0.7));
	}

	SECTION("inputs outside [0,1] saturate")
	{
		REQUIRE(sigmoid01(-3.0, 0.5, 10.0) == 0.0);
		REQUIRE(sigmoid01(7.0, 0.5, 10.0) == 1.0);
	}

	SECTION("very steep curves stay finite")
	{
		REQUIRE(sigmoid01(0.01, 0.99, 1e6) == Approx(0.0).margin(1e-12));
		REQUIRE(sigmoid01(0.99, 0.01, 1e6) == Approx(1.0));
	}
}

TEST_CASE("psiwave/core/transforms/apply", "[transforms]")
{
	SECTION("identity")
	{
		IdentityTransform t;
		REQUIRE(t.apply(0.42) == 0.42);
	}

	SECTION("linear maps the unit interval onto [low, high]")
	{
		LinearTransform t(0.5, 4.0);
		REQUIRE(t.apply(0.0) == Approx(0.5));
		REQUIRE(t.apply(1.0) == Approx(4.0));
		REQUIRE(t.apply(0.5) == Approx(2.25));
	}

	SECTION("linear with low > high inverts")
	{
		LinearTransform t(1.0, 0.25);
		REQUIRE(t.apply(0.0) == Approx(1.0));
		REQUIRE(t.apply(1.0) == Approx(0.25));
	}

	SECTION("sigmoid endpoints land on low and high")
	{
		SigmoidTransform t(0.0, 1.0, 0.5, 10.0);
		REQUIRE(t.apply(0.0) == 0.0);
		REQUIRE(t.apply(1.0) == 1.0);

		SigmoidTransform ranged(2.0, 6.0, 0.2, 30.0);
		REQUIRE(ranged.apply(0.0) == Approx(2.0));
		REQUIRE(ranged.apply(1.0) == Approx(6.0));
	}

	SECTION("raw recovers the control byte")
	{
		RawCcTransform t;
		REQUIRE(t.apply(0.0) == 0.0);
		REQUIRE(t.apply(1.0) == Approx(127.0));
		REQUIRE(t.apply(64.0 / 127.0) == Approx(64.0));
	}
}

TEST_CASE("psiwave/core/transforms/json", "[transforms][json]")
{
	SECTION("missing kind is identity")
	{
		auto t = transform_from_json(QJsonObject());
		REQUIRE(t);
		REQUIRE(t->name() == "Identity");
	}

	SECTION("linear parameters are read")
	{
		QJsonObject o;
		o["kind"] = "linear";
		o["low"] = 0.5;
		o["high"] = 2.0;
		auto t = transform_from_json(o);
		REQUIRE(t);
		REQUIRE(t->apply(1.0) == Approx(2.0));
		REQUIRE(t->to_json() == o);
	}

	SECTION("sigmoid defaults")
	{
		QJsonObject o;
		o["kind"] = "Sigmoid";
		auto t = std::dynamic_pointer_cast<const SigmoidTransform>(transform_from_json(o));
		REQUIRE(t);
		REQUIRE(t->threshold() == Approx(0.5));
		REQUIRE(t->steepness() == Approx(10.0));
	}

	SECTION("raw and raw_cc are the same transform")
	{
		QJsonObject a;
		a["kind"] = "raw";
		QJsonObject b;
		b["kind"] = "raw_cc";
		REQUIRE(transform_from_json(a)->name() == "RawCC");
		REQUIRE(transform_from_json(b)->name() == "RawCC");
	}

	SECTION("unknown kind reports an error")
	{
		QJsonObject o;
		o["kind"] = "exponential";
		QString error;
		REQUIRE_FALSE(transform_from_json(o, &error));
		REQUIRE(error.contains("exponential"));
	}
}
