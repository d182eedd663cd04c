#include "text_scroll_effect.hpp"

#include "../render/canvas.hpp"

#include <QFont>
#include <QPainter>

#include <cmath>

namespace psiwave {

TextScrollEffect::TextScrollEffect(const QString &message)
	: Effect(QStringLiteral("text_scroll"))
	, m_message(message.isEmpty() ? QStringLiteral(" ") : message)
{
	m_params.declare("speed", 1.0);	// Scroll speed multiplier
	m_params.declare("color", 0.0);	// Raw 0-127 white to hue blend
}

QString TextScrollEffect::default_message()
{
	return QString::fromUtf8("\xCF\x88~ PsiWave \xCF\x88~");
}

void TextScrollEffect::set_text(const QString &message)
{
	m_message = message.isEmpty() ? QStringLiteral(" ") : message;
	m_dirty = true;
}

const QImage &TextScrollEffect::glyphs()
{
	if (m_dirty)
		render_message();
	return m_glyphs;
}

void TextScrollEffect::render_message()
{
	m_dirty = false;

	const int render_px = kFontPixels * kRenderScale;
	QFont font(QStringLiteral("DejaVu Sans"));
	font.setPixelSize(render_px);

	// Draw large, white on black, then downsample for smooth edges.
	QImage big(2000, render_px + 16, QImage::Format_RGB32);
	big.fill(Qt::black);
	{
		QPainter p(&big);
		p.setRenderHint(QPainter::TextAntialiasing);
		p.setFont(font);
		p.setPen(Qt::white);
		p.drawText(QRect(0, 0, big.width(), big.height()),
			Qt::AlignLeft | Qt::AlignTop, m_message);
	}

	int right = -1;
	int bottom = -1;
	for (int y = 0; y < big.height(); y++) {
		const auto *line = reinterpret_cast<const QRgb *>(big.constScanLine(y));
		for (int x = 0; x < big.width(); x++) {
			if (qRed(line[x]) > 0) {
				right = qMax(right, x);
				bottom = qMax(bottom, y);
			}
		}
	}

	if (right < 0) {
		m_glyphs = QImage();
		return;
	}

	const QImage cropped = big.copy(0, 0, right + 5, bottom + 5);
	const int target_w = qMax(1, cropped.width() * kFontPixels / cropped.height());
	m_glyphs = cropped.scaled(target_w, kFontPixels, Qt::IgnoreAspectRatio,
		Qt::SmoothTransformation).convertToFormat(QImage::Format_Grayscale8);
}

double TextScrollEffect::scroll_px(double t) const
{
	if (m_external_px)
		return *m_external_px;
	return t * kPixelsPerSecond * parameter("speed");
}

Rgb TextScrollEffect::text_colour(double t) const
{
	const double raw = parameter("color");
	const double u = clamp01(raw / kMaxControlValue);
	const Rgb white = {255, 255, 255};
	return mix(white, hue_to_rgb(t * 0.5 + raw / kMaxControlValue), u);
}

void TextScrollEffect::draw(Canvas &canvas, double t)
{
	const QImage &mask = glyphs();
	if (mask.isNull())
		return;

	const int w = canvas.width();
	const int h = canvas.height();
	const int msg_w = mask.width();
	const int cycle = msg_w + w;
	const Rgb c = text_colour(t);

	int src_x = static_cast<int>(std::floor(scroll_px(t))) % cycle;
	if (src_x < 0)
		src_x += cycle;

	const int y0 = qMax(0, (h - mask.height()) / 2);
	for (int dy = 0; dy < mask.height(); dy++) {
		const int y = y0 + dy;
		if (y >= h)
			break;
		const uchar *line = mask.constScanLine(dy);
		for (int dx = 0; dx < w; dx++) {
			const int v = src_x + dx;
			const double br = v < msg_w ? line[v] / 255.0 : 0.0;
			canvas.set_pixel(dx, y, static_cast<int>(c.r * br),
				static_cast<int>(c.g * br), static_cast<int>(c.b * br));
		}
	}
}

} // namespace psiwave
