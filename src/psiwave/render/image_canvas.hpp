#pragma once

#include "canvas.hpp"

#include <QColor>
#include <QImage>

namespace psiwave {

// QImage-backed canvas: one image pixel per LED.
class ImageCanvas : public Canvas {
public:
	ImageCanvas(int width, int height);

	int width() const override { return m_image.width(); }
	int height() const override { return m_image.height(); }

	void set_pixel(int x, int y, int r, int g, int b) override;
	void clear() override;

	QColor pixel(int x, int y) const;

	// Lit (non-black) LEDs.
	int lit_count() const;

	const QImage &image() const { return m_image; }

private:
	QImage m_image;
};

} // namespace psiwave
