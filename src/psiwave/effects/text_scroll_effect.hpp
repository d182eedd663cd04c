#pragma once

#include "effect.hpp"

#include <QImage>
#include <QString>

#include <optional>

namespace psiwave {

// ---------------------------------------------------------------------------
// TextScrollEffect — Scrolls an antialiased message right to left.
//
// Parameters:
//   speed  scroll speed multiplier (default 1)
//   color  raw 0..127; 0 = white, 127 = cycling hue
// ---------------------------------------------------------------------------
class TextScrollEffect : public Effect {
public:
	static constexpr int kFontPixels = 14;
	static constexpr int kRenderScale = 3;
	static constexpr double kPixelsPerSecond = 2.4;

	explicit TextScrollEffect(const QString &message = default_message());

	static QString default_message();

	void draw(Canvas &canvas, double t) override;

	void set_text(const QString &message);
	const QString &text() const { return m_message; }

	// Clock-driven scroll offset in pixels; nullopt = free-running.
	void set_scroll_phase(std::optional<double> px) { m_external_px = px; }
	std::optional<double> scroll_phase() const { return m_external_px; }

	double scroll_px(double t) const;
	Rgb text_colour(double t) const;

	// Grayscale coverage mask of the message, kFontPixels high.
	const QImage &glyphs();

private:
	void render_message();

	QString m_message;
	QImage m_glyphs;
	bool m_dirty = true;
	std::optional<double> m_external_px;
};

} // namespace psiwave
