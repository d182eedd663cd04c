#pragma once

#include "effect.hpp"

#include <QRandomGenerator>
#include <QStringList>
#include <QVector>

#include <optional>

namespace psiwave {

enum class StarColour {
	White,
	Blue,
	Cyan,
	Yellow,
	Orange,
	Red,
};

std::optional<StarColour> star_colour_from_name(const QString &name);
QString star_colour_name(StarColour colour);

// Every star colour, in palette order.
QVector<StarColour> star_palette();

// ---------------------------------------------------------------------------
// StarfieldEffect — Stars spawn near the centre and stream outward.
//
// Parameters:
//   speed         outward speed multiplier (default 1)
//   color_amount  0 = all white, 1 = full per-star colour
// ---------------------------------------------------------------------------
class StarfieldEffect : public Effect {
public:
	static constexpr int kDefaultStarCount = 100;

	struct Star {
		double x = 0.0;
		double y = 0.0;
		int brightness = 255;
		double speed = 1.0;
		double twinkle_speed = 0.05;
		double twinkle_phase = 0.0;
		StarColour colour = StarColour::White;
	};

	// `seed` makes the field reproducible.
	explicit StarfieldEffect(int star_count = kDefaultStarCount,
							 std::optional<quint32> seed = std::nullopt);

	void setup(const Matrix &matrix) override;
	void activate() override;
	void draw(Canvas &canvas, double t) override;

	// Colour given to stars as they respawn; nullopt = random.
	void set_spawn_colour(std::optional<StarColour> colour) { m_spawn_colour = colour; }
	std::optional<StarColour> spawn_colour() const { return m_spawn_colour; }

	void set_debug(bool enabled) { m_debug = enabled; }

	const QVector<Star> &stars() const { return m_stars; }

	// Twinkled and colour-blended RGB of one star.
	Rgb star_rgb(const Star &star) const;

private:
	void spawn(Star &star, bool fresh);
	void update(double dt);

	int m_star_count;
	QRandomGenerator m_rng;
	QVector<Star> m_stars;
	std::optional<StarColour> m_spawn_colour;
	std::optional<double> m_last_t;
	bool m_debug = false;
	double m_last_debug_t = -1e9;
};

} // namespace psiwave
