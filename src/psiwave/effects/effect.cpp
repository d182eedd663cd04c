#include "effect.hpp"

#include "../render/canvas.hpp"

#include <QtGlobal>

#include <cmath>

namespace psiwave {

Rgb dim(const Rgb &c, double factor)
{
	return {static_cast<int>(c.r * factor),
			static_cast<int>(c.g * factor),
			static_cast<int>(c.b * factor)};
}

Rgb mix(const Rgb &a, const Rgb &b, double t)
{
	return {static_cast<int>(a.r + (b.r - a.r) * t),
			static_cast<int>(a.g + (b.g - a.g) * t),
			static_cast<int>(a.b + (b.b - a.b) * t)};
}

Rgb hue_to_rgb(double h)
{
	h -= std::floor(h);
	const int i = static_cast<int>(h * 6.0) % 6;
	const double f = h * 6.0 - static_cast<int>(h * 6.0);
	const int up = static_cast<int>(255 * f);
	const int down = static_cast<int>(255 * (1.0 - f));

	switch (i) {
	case 0:  return {255, up, 0};
	case 1:  return {down, 255, 0};
	case 2:  return {0, 255, up};
	case 3:  return {0, down, 255};
	case 4:  return {up, 0, 255};
	default: return {255, 0, down};
	}
}

Effect::Effect(const QString &name)
	: m_name(name)
{
}

void Effect::setup(const Matrix &matrix)
{
	m_width = matrix.width();
	m_height = matrix.height();
}

void Effect::handle_note(const NoteEvent &note)
{
	Q_UNUSED(note);
}

bool Effect::set_parameter(const QString &name, double value)
{
	return m_params.set(name, value);
}

} // namespace psiwave
