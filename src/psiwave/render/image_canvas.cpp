#include "image_canvas.hpp"

#include <QtGlobal>

namespace psiwave {

ImageCanvas::ImageCanvas(int width, int height)
	: m_image(qMax(1, width), qMax(1, height), QImage::Format_RGB32)
{
	m_image.fill(Qt::black);
}

void ImageCanvas::set_pixel(int x, int y, int r, int g, int b)
{
	if (x < 0 || y < 0 || x >= m_image.width() || y >= m_image.height())
		return;
	m_image.setPixel(x, y, qRgb(qBound(0, r, 255), qBound(0, g, 255), qBound(0, b, 255)));
}

void ImageCanvas::clear()
{
	m_image.fill(Qt::black);
}

QColor ImageCanvas::pixel(int x, int y) const
{
	if (x < 0 || y < 0 || x >= m_image.width() || y >= m_image.height())
		return QColor(Qt::black);
	return QColor(m_image.pixel(x, y));
}

int ImageCanvas::lit_count() const
{
	int count = 0;
	for (int y = 0; y < m_image.height(); y++) {
		const auto *line = reinterpret_cast<const QRgb *>(m_image.constScanLine(y));
		for (int x = 0; x < m_image.width(); x++) {
			if ((line[x] & 0x00FFFFFF) != 0)
				count++;
		}
	}
	return count;
}

} // namespace psiwave
