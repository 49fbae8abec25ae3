#pragma once

// C++
#include <cstdint>

// XCB
#include <xcb/xproto.h>

// cosmos
#include "cosmos/BitMask.hxx"

namespace ximc {

/**
 * @file
 *
 * This header contains simpler utility types used throughout the project.
 **/

/// Identifier of a server side input context.
/**
 * The XIM protocol transports input context IDs as 16 bit values. The value
 * zero is never handed out by a server and is used to signal failed context
 * creation.
 **/
enum class ContextID : uint16_t {
	INVALID = 0
};

constexpr uint16_t raw_ctx(const ContextID ctx) {
	return static_cast<uint16_t>(ctx);
}

/// A spot location in pixel units relative to a window's origin.
struct Spot {
	int16_t x = 0;
	int16_t y = 0;

	bool operator==(const Spot &other) const {
		return x == other.x && y == other.y;
	}

	bool operator!=(const Spot &other) const {
		return !(*this == other);
	}
};

/// Where the input method should place its candidate window.
/**
 * The coordinates are relative to the top left corner of `window`.
 **/
struct Placement {
public: // data
	xcb_window_t window = XCB_WINDOW_NONE;
	int16_t x = 0;
	int16_t y = 0;

public: // functions

	Spot spot() const { return Spot{x, y}; }

	bool sameWindow(const Placement &other) const {
		return window == other.window;
	}

	bool operator==(const Placement &other) const {
		return window == other.window && x == other.x && y == other.y;
	}

	bool operator!=(const Placement &other) const {
		return !(*this == other);
	}
};

/// Input style capability flags negotiated during input context creation.
/**
 * The default (empty) style lets the input method handle composition
 * internally. The application then only receives the final commit strings.
 **/
enum class InputStyleFlag : uint32_t {
	/// Report live composition via the preedit start/draw/done callbacks.
	/**
	 * This allows displaying the text currently being edited inside the
	 * application. The input method may stop displaying its own cursor
	 * in this mode.
	 **/
	PREEDIT_CALLBACKS = 0x0002
};

using InputStyle = cosmos::BitMask<InputStyleFlag>;

/// Rendering hints for individual preedit characters.
enum class InputFeedbackFlag : uint32_t {
	REVERSE             = 1 << 0,  ///< swap foreground and background colors
	UNDERLINE           = 1 << 1,  ///< underline the text
	HIGHLIGHT           = 1 << 2,  ///< some unique manner different from REVERSE and UNDERLINE
	PRIMARY             = 1 << 5,  ///< some unique manner different from REVERSE and UNDERLINE
	SECONDARY           = 1 << 6,  ///< some unique manner different from REVERSE and UNDERLINE
	TERTIARY            = 1 << 7,  ///< some unique manner different from REVERSE and UNDERLINE
	VISIBLE_TO_FORWARD  = 1 << 8,  ///< display forward from the caret in primary draw direction
	VISIBLE_TO_BACKWARD = 1 << 9,  ///< display backward from the caret
	VISIBLE_TO_CENTER   = 1 << 10  ///< display with the caret centered
};

/// Feedback for a single preedit character, an empty mask means normal drawing.
using InputFeedback = cosmos::BitMask<InputFeedbackFlag>;

/// The text encoding negotiated with the input method server.
enum class TextEncoding {
	COMPOUND_TEXT,
	UTF8_STRING
};

} // end ns
