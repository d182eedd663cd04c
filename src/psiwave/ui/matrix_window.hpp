#pragma once

// ============================================================================
// On-screen LED matrix emulator.
//
//   MatrixWindow  — QWidget that paints one frame, each LED a scale×scale
//                   square, with an FPS overlay.
//   ScreenMatrix  — Matrix implementation driving a MatrixWindow with two
//                   ImageCanvas buffers.
//
// Keys: q / Escape close, n / space next effect, f toggles full screen.
// ============================================================================

#include "../render/canvas.hpp"
#include "../render/image_canvas.hpp"

#include <QElapsedTimer>
#include <QImage>
#include <QObject>
#include <QWidget>

#include <memory>

namespace psiwave {

class MatrixWindow : public QWidget {
	Q_OBJECT

public:
	MatrixWindow(int width, int height, int scale, QWidget *parent = nullptr);

	void present(const QImage &frame);
	void blank();

	const QImage &frame() const { return m_frame; }
	int scale() const { return m_scale; }
	double fps() const { return m_fps; }

signals:
	void closed();
	void next_requested();

protected:
	void paintEvent(QPaintEvent *event) override;
	void keyPressEvent(QKeyEvent *event) override;
	void closeEvent(QCloseEvent *event) override;

private:
	QImage m_frame;
	int m_scale;
	QElapsedTimer m_frame_timer;
	double m_fps = 0.0;
};

class ScreenMatrix : public QObject, public Matrix {
	Q_OBJECT

public:
	ScreenMatrix(int width, int height, int scale = 8, QObject *parent = nullptr);
	~ScreenMatrix() override;

	int width() const override { return m_width; }
	int height() const override { return m_height; }

	Canvas *create_frame_canvas() override;
	Canvas *swap_on_vsync(Canvas *canvas) override;
	void clear() override;

	void show();
	bool is_closed() const { return m_closed; }
	MatrixWindow *window() const { return m_window.get(); }

signals:
	void closed();
	void next_requested();

private:
	ImageCanvas *other(Canvas *canvas);

	int m_width;
	int m_height;
	ImageCanvas m_canvas0;
	ImageCanvas m_canvas1;
	bool m_front_is_first = true;
	bool m_closed = false;
	std::unique_ptr<MatrixWindow> m_window;
};

} // namespace psiwave
