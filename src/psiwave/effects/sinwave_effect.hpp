#pragma once

#include "effect.hpp"

#include <QVector>

#include <optional>

namespace psiwave {

// ---------------------------------------------------------------------------
// SinwaveEffect — Sine band with a vertical bar overlay.
//
// Parameters:
//   speed         phase speed multiplier (default 1)
//   wavelength    spatial wavelength multiplier, lower = shorter (default 1)
//   color         raw 0..127, morphs blue -> red
//   phase_offset  radians added to the phase
// ---------------------------------------------------------------------------
class SinwaveEffect : public Effect {
public:
	static constexpr double kBaseSpeed = 5.0;
	static constexpr double kBaseFrequency = 0.15;
	static constexpr double kMaxDt = 0.10;
	static constexpr int kAmplitude = 9;
	static constexpr int kBandWidth = 4;
	static constexpr double kDimFactor = 0.6;
	static constexpr double kBarPosition = 0.3;	// Fraction of the width

	SinwaveEffect();

	void setup(const Matrix &matrix) override;
	void activate() override;
	void draw(Canvas &canvas, double t) override;

	// Clock-driven phase; nullopt returns to the internal integrator.
	void set_external_phase(std::optional<double> phase);
	std::optional<double> external_phase() const { return m_external_phase; }

	// Spatial sync. Clamped to >= 0.01.
	void set_wavelength_mult(double mult);

	// Phase used by the last draw().
	double current_phase() const { return m_current_phase; }

	Rgb current_colour() const;

private:
	void put(Canvas &canvas, int x, int y, const Rgb &c, bool blend);
	void draw_sine(Canvas &canvas, double phase, double frequency, const Rgb &colour);
	void draw_bar(Canvas &canvas, const Rgb &colour);

	QVector<Rgb> m_pixels;		// Row-major, for max-blending the bar
	double m_phase_accum = 0.0;
	std::optional<double> m_last_t;
	std::optional<double> m_external_phase;
	double m_current_phase = 0.0;
};

} // namespace psiwave
