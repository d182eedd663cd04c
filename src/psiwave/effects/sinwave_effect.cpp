#include "sinwave_effect.hpp"

#include "../render/canvas.hpp"

#include <algorithm>
#include <cmath>

namespace psiwave {

namespace {

const Rgb kColour1 = {50, 50, 255};
const Rgb kColour2 = {255, 50, 50};

} // namespace

SinwaveEffect::SinwaveEffect()
	: Effect(QStringLiteral("sinwave"))
{
	m_params.declare("speed", 1.0);	// Phase speed multiplier
	m_params.declare("wavelength", 1.0);	// Spatial wavelength multiplier
	m_params.declare("color", 0.0);	// Raw 0-127 colour morph
	m_params.declare("phase_offset", 0.0);	// Phase offset in radians
}

void SinwaveEffect::setup(const Matrix &matrix)
{
	Effect::setup(matrix);
	m_pixels.fill(Rgb(), m_width * m_height);
}

void SinwaveEffect::activate()
{
	m_phase_accum = 0.0;
	m_last_t.reset();
	m_external_phase.reset();
}

void SinwaveEffect::set_external_phase(std::optional<double> phase)
{
	m_external_phase = phase;
	if (!phase)
		m_last_t.reset();
}

void SinwaveEffect::set_wavelength_mult(double mult)
{
	m_params.set("wavelength", std::max(0.01, mult));
}

Rgb SinwaveEffect::current_colour() const
{
	return mix(kColour1, kColour2, clamp01(parameter("color") / kMaxControlValue));
}

void SinwaveEffect::put(Canvas &canvas, int x, int y, const Rgb &c, bool blend)
{
	if (x < 0 || y < 0 || x >= m_width || y >= m_height)
		return;

	Rgb &cur = m_pixels[y * m_width + x];
	if (blend)
		cur = {std::max(cur.r, c.r), std::max(cur.g, c.g), std::max(cur.b, c.b)};
	else
		cur = c;
	canvas.set_pixel(x, y, cur.r, cur.g, cur.b);
}

void SinwaveEffect::draw_sine(Canvas &canvas, double phase, double frequency,
							  const Rgb &colour)
{
	const double vertical_offset = m_height / 4.0 + kBandWidth - 2;

	for (int x = 0; x < m_width; x++) {
		const int y_center = static_cast<int>(std::lround(
			kAmplitude * std::sin(frequency * x + phase) + vertical_offset));

		put(canvas, x, y_center, colour, false);

		Rgb soft = colour;
		for (int w = 1; w < kBandWidth; w++) {
			soft = dim(soft, kDimFactor);
			put(canvas, x, y_center - w, soft, false);
			put(canvas, x, y_center + w, soft, false);
		}
	}
}

void SinwaveEffect::draw_bar(Canvas &canvas, const Rgb &colour)
{
	const int x_centre = static_cast<int>(kBarPosition * m_width);

	for (int y = 0; y < m_height; y++) {
		put(canvas, x_centre, y, colour, true);

		Rgb soft = colour;
		for (int w = 1; w < kBandWidth; w++) {
			soft = dim(soft, kDimFactor);
			put(canvas, x_centre + w, y, soft, true);
			put(canvas, x_centre - w, y, soft, true);
		}
	}
}

void SinwaveEffect::draw(Canvas &canvas, double t)
{
	if (m_width != canvas.width() || m_height != canvas.height()) {
		m_width = canvas.width();
		m_height = canvas.height();
	}
	m_pixels.fill(Rgb(), m_width * m_height);

	if (m_external_phase) {
		m_current_phase = *m_external_phase;
	} else {
		double dt = 0.0;
		if (m_last_t)
			dt = std::clamp(t - *m_last_t, 0.0, kMaxDt);
		m_last_t = t;

		m_phase_accum += kBaseSpeed * parameter("speed") * dt;
		m_current_phase = m_phase_accum;
	}

	const double wavelength = std::max(1e-4, parameter("wavelength"));
	const double frequency = kBaseFrequency / wavelength;
	const Rgb colour = current_colour();

	draw_sine(canvas, m_current_phase + parameter("phase_offset"), frequency, colour);
	draw_bar(canvas, colour);
}

} // namespace psiwave
