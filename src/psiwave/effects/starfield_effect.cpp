#include "starfield_effect.hpp"

#include "../render/canvas.hpp"
#include "utils/log_support.hpp"

#include <cmath>

namespace psiwave {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr double kSpawnSpreadX = 15.0;
constexpr double kSpawnSpreadY = 12.0;
constexpr double kMotionScale = 2.5;

} // namespace

std::optional<StarColour> star_colour_from_name(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if (n == "white")	return StarColour::White;
	if (n == "blue")	return StarColour::Blue;
	if (n == "cyan")	return StarColour::Cyan;
	if (n == "yellow")	return StarColour::Yellow;
	if (n == "orange")	return StarColour::Orange;
	if (n == "red")		return StarColour::Red;
	return std::nullopt;
}

QString star_colour_name(StarColour colour)
{
	switch (colour) {
	case StarColour::White:		return QStringLiteral("white");
	case StarColour::Blue:		return QStringLiteral("blue");
	case StarColour::Cyan:		return QStringLiteral("cyan");
	case StarColour::Yellow:	return QStringLiteral("yellow");
	case StarColour::Orange:	return QStringLiteral("orange");
	case StarColour::Red:		return QStringLiteral("red");
	}
	return QStringLiteral("white");
}

QVector<StarColour> star_palette()
{
	return {StarColour::White, StarColour::Blue, StarColour::Cyan,
			StarColour::Yellow, StarColour::Orange, StarColour::Red};
}

// ===== StarfieldEffect ====================================================

StarfieldEffect::StarfieldEffect(int star_count, std::optional<quint32> seed)
	: Effect(QStringLiteral("starfield"))
	, m_star_count(qMax(0, star_count))
	, m_rng(seed ? *seed : QRandomGenerator::global()->generate())
{
	m_params.declare("speed", 1.0);	// Outward speed multiplier
	m_params.declare("color_amount", 0.0);	// Blend from white to star colour
}

void StarfieldEffect::spawn(Star &star, bool fresh)
{
	star.x = m_width / 2.0 + (m_rng.generateDouble() * 2.0 - 1.0) * kSpawnSpreadX;
	star.y = m_height / 2.0 + (m_rng.generateDouble() * 2.0 - 1.0) * kSpawnSpreadY;

	if (fresh) {
		star.brightness = m_rng.bounded(50, 256);
		star.speed = 1.5 + m_rng.generateDouble() * 2.5;
		star.twinkle_speed = 0.02 + m_rng.generateDouble() * 0.06;
		star.twinkle_phase = m_rng.generateDouble() * kTwoPi;
	}

	if (m_spawn_colour) {
		star.colour = *m_spawn_colour;
	} else if (fresh) {
		const auto palette = star_palette();
		star.colour = palette[m_rng.bounded(static_cast<int>(palette.size()))];
	}
}

void StarfieldEffect::setup(const Matrix &matrix)
{
	Effect::setup(matrix);
	m_stars.resize(m_star_count);
	for (auto &star : m_stars)
		spawn(star, true);
	m_last_t.reset();
}

void StarfieldEffect::activate()
{
	// Avoid a large dt jump when switching back.
	m_last_t.reset();
}

void StarfieldEffect::update(double dt)
{
	const double cx = m_width / 2.0;
	const double cy = m_height / 2.0;
	const double speed_mult = parameter("speed");

	for (auto &star : m_stars) {
		const double dx = star.x - cx;
		const double dy = star.y - cy;

		if (std::abs(dx) > 0.1 || std::abs(dy) > 0.1) {
			// Manhattan length.
			const double length = std::abs(dx) + std::abs(dy);
			const double step = star.speed * speed_mult * dt * kMotionScale;
			star.x += dx / length * step;
			star.y += dy / length * step;
		}

		if (star.x < 0 || star.x >= m_width || star.y < 0 || star.y >= m_height)
			spawn(star, false);

		star.twinkle_phase += star.twinkle_speed * 0.5;
	}
}

Rgb StarfieldEffect::star_rgb(const Star &star) const
{
	const double twinkle = 0.5 + 0.5 * std::sin(star.twinkle_phase);
	const int b = static_cast<int>(star.brightness * twinkle);

	Rgb tinted;
	switch (star.colour) {
	case StarColour::White:		tinted = {b, b, b}; break;
	case StarColour::Blue:		tinted = {b / 3, b / 3, b}; break;
	case StarColour::Cyan:		tinted = {b / 3, b, b}; break;
	case StarColour::Yellow:	tinted = {b, b, b / 3}; break;
	case StarColour::Orange:	tinted = {b, b / 2, b / 6}; break;
	case StarColour::Red:		tinted = {b, b / 6, b / 6}; break;
	}

	return mix({b, b, b}, tinted, clamp01(parameter("color_amount")));
}

void StarfieldEffect::draw(Canvas &canvas, double t)
{
	if (static_cast<int>(m_stars.size()) != m_star_count || m_width != canvas.width() ||
	    m_height != canvas.height()) {
		m_width = canvas.width();
		m_height = canvas.height();
		m_stars.resize(m_star_count);
		for (auto &star : m_stars)
			spawn(star, true);
	}

	double dt = 0.0;
	if (m_last_t)
		dt = qMax(0.0, t - *m_last_t);
	m_last_t = t;

	update(dt);

	for (const auto &star : m_stars) {
		const Rgb c = star_rgb(star);
		canvas.set_pixel(static_cast<int>(star.x), static_cast<int>(star.y), c.r, c.g, c.b);
	}

	if (m_debug && t - m_last_debug_t >= 2.0) {
		m_last_debug_t = t;
		psi_log(LOG_INFO, "[starfield] speed=%.3f color_amount=%.3f spawn=%s",
			parameter("speed"), parameter("color_amount"),
			m_spawn_colour ? star_colour_name(*m_spawn_colour).toUtf8().constData()
						   : "random");
	}
}

} // namespace psiwave
