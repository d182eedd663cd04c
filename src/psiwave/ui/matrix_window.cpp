#include "matrix_window.hpp"

#include <QCloseEvent>
#include <QKeyEvent>
#include <QPainter>

namespace psiwave {

// ===== MatrixWindow =======================================================

MatrixWindow::MatrixWindow(int width, int height, int scale, QWidget *parent)
	: QWidget(parent)
	, m_frame(qMax(1, width), qMax(1, height), QImage::Format_RGB32)
	, m_scale(qMax(1, scale))
{
	m_frame.fill(Qt::black);
	setWindowTitle(QStringLiteral("psiwave (screen)"));
	setAttribute(Qt::WA_OpaquePaintEvent);
	setFocusPolicy(Qt::StrongFocus);
	resize(m_frame.width() * m_scale, m_frame.height() * m_scale);
}

void MatrixWindow::present(const QImage &frame)
{
	m_frame = frame;

	if (m_frame_timer.isValid()) {
		const double dt = qMax(1e-6, m_frame_timer.nsecsElapsed() / 1e9);
		const double current = 1.0 / dt;
		m_fps = m_fps <= 0.0 ? current : m_fps * 0.9 + current * 0.1;
	}
	m_frame_timer.start();

	update();
}

void MatrixWindow::blank()
{
	m_frame.fill(Qt::black);
	update();
}

void MatrixWindow::paintEvent(QPaintEvent *event)
{
	Q_UNUSED(event);

	QPainter p(this);
	p.setRenderHint(QPainter::SmoothPixmapTransform, false);
	p.fillRect(rect(), Qt::black);

	// Keep LEDs square and centred when the window is resized.
	const int s = qMax(1, qMin(width() / m_frame.width(), height() / m_frame.height()));
	const QSize size(m_frame.width() * s, m_frame.height() * s);
	const QRect target(QPoint((width() - size.width()) / 2,
		(height() - size.height()) / 2), size);
	p.drawImage(target, m_frame);

	if (m_fps > 0.0) {
		QFont f = p.font();
		f.setPixelSize(14);
		p.setFont(f);
		p.setPen(QColor(230, 230, 230));
		p.drawText(rect().adjusted(0, 8, -8, 0), Qt::AlignTop | Qt::AlignRight,
			QStringLiteral("%1 FPS").arg(m_fps, 5, 'f', 1));
	}
}

void MatrixWindow::keyPressEvent(QKeyEvent *event)
{
	switch (event->key()) {
	case Qt::Key_Q:
	case Qt::Key_Escape:
		close();
		return;
	case Qt::Key_N:
	case Qt::Key_Space:
		emit next_requested();
		return;
	case Qt::Key_F:
		if (isFullScreen())
			showNormal();
		else
			showFullScreen();
		return;
	default:
		QWidget::keyPressEvent(event);
	}
}

void MatrixWindow::closeEvent(QCloseEvent *event)
{
	emit closed();
	QWidget::closeEvent(event);
}

// ===== ScreenMatrix =======================================================

ScreenMatrix::ScreenMatrix(int width, int height, int scale, QObject *parent)
	: QObject(parent)
	, m_width(qMax(1, width))
	, m_height(qMax(1, height))
	, m_canvas0(m_width, m_height)
	, m_canvas1(m_width, m_height)
	, m_window(std::make_unique<MatrixWindow>(m_width, m_height, scale))
{
	connect(m_window.get(), &MatrixWindow::closed, this, [this]() {
		m_closed = true;
		emit closed();
	});
	connect(m_window.get(), &MatrixWindow::next_requested,
		this, &ScreenMatrix::next_requested);
}

ScreenMatrix::~ScreenMatrix() = default;

void ScreenMatrix::show()
{
	m_window->show();
}

ImageCanvas *ScreenMatrix::other(Canvas *canvas)
{
	return canvas == &m_canvas0 ? &m_canvas1 : &m_canvas0;
}

Canvas *ScreenMatrix::create_frame_canvas()
{
	ImageCanvas *c = m_front_is_first ? &m_canvas0 : &m_canvas1;
	m_front_is_first = !m_front_is_first;
	return c;
}

Canvas *ScreenMatrix::swap_on_vsync(Canvas *canvas)
{
	if (!m_closed && (canvas == &m_canvas0 || canvas == &m_canvas1))
		m_window->present(static_cast<ImageCanvas *>(canvas)->image());
	return other(canvas);
}

void ScreenMatrix::clear()
{
	m_canvas0.clear();
	m_canvas1.clear();
	if (!m_closed)
		m_window->blank();
}

} // namespace psiwave
