#pragma once

// ============================================================================
// Display abstraction — an LED matrix and the frame canvases it swaps.
// Implemented by the on-screen emulator and by test doubles.
// ============================================================================

namespace psiwave {

// ---------------------------------------------------------------------------
// Canvas — One frame buffer of width × height RGB LEDs.
// Out-of-range coordinates are ignored.
// ---------------------------------------------------------------------------
class Canvas {
public:
	virtual ~Canvas() = default;

	virtual int width() const = 0;
	virtual int height() const = 0;

	virtual void set_pixel(int x, int y, int r, int g, int b) = 0;
	virtual void clear() = 0;
};

// ---------------------------------------------------------------------------
// Matrix — The display. Owns its canvases.
// ---------------------------------------------------------------------------
class Matrix {
public:
	virtual ~Matrix() = default;

	virtual int width() const = 0;
	virtual int height() const = 0;

	// A back buffer the caller draws into.
	virtual Canvas *create_frame_canvas() = 0;

	// Present `canvas` and return the buffer to draw the next frame into.
	virtual Canvas *swap_on_vsync(Canvas *canvas) = 0;

	// Blank the display.
	virtual void clear() = 0;
};

} // namespace psiwave
