#pragma once

// ============================================================================
// Effect — base class for the matrix demos.
//
// Lifecycle (driven by the render loop):
//   setup(matrix)        once, before the first frame
//   activate()           each time the effect becomes the active demo
//   draw(canvas, t)      every frame, t = seconds since start
//   handle_note(note)    for each MIDI note while active
//
// Parameters are declared in the constructor with their defaults; the CC
// router writes them through set_parameter(). Effects never see CC numbers.
// ============================================================================

#include "../core/control_types.hpp"
#include "../core/parameter_set.hpp"

#include <QString>

namespace psiwave {

class Canvas;
class Matrix;

// ---------------------------------------------------------------------------
// Colour helpers
// ---------------------------------------------------------------------------
struct Rgb {
	int r = 0;
	int g = 0;
	int b = 0;
};

inline bool operator==(const Rgb &a, const Rgb &b)
{
	return a.r == b.r && a.g == b.g && a.b == b.b;
}

Rgb dim(const Rgb &c, double factor);
Rgb mix(const Rgb &a, const Rgb &b, double t);

// Fully saturated hue, h wraps into [0, 1).
Rgb hue_to_rgb(double h);

// ---------------------------------------------------------------------------
// Effect
// ---------------------------------------------------------------------------
class Effect : public ParameterSink {
public:
	explicit Effect(const QString &name);
	~Effect() override = default;

	const QString &name() const { return m_name; }

	virtual void setup(const Matrix &matrix);
	virtual void activate() {}
	virtual void draw(Canvas &canvas, double t) = 0;
	virtual void handle_note(const NoteEvent &note);

	// ParameterSink
	bool set_parameter(const QString &name, double value) override;

	double parameter(const QString &name) const { return m_params.value(name); }
	const ParameterSet &parameters() const { return m_params; }

	int width() const { return m_width; }
	int height() const { return m_height; }

protected:
	ParameterSet m_params;
	int m_width = 0;
	int m_height = 0;

private:
	QString m_name;
};

} // namespace psiwave
