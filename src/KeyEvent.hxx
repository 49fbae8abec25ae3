#pragma once

// XCB
#include <xcb/xproto.h>

namespace ximc {

/// Borrowed view of a key press or key release event.
/**
 * Instances are only handed out by reference for the duration of a single
 * callback invocation. The underlying event memory belongs to the caller
 * of Client::processEvent() or to the protocol engine, it must not be
 * accessed after the callback returned.
 *
 * The XCB key press and key release event structures are identical, the
 * type is distinguished via the response type.
 **/
class KeyEvent {
public: // functions

	explicit KeyEvent(const xcb_key_press_event_t &event) :
			m_event{event} {}

	KeyEvent(const KeyEvent&) = delete;
	KeyEvent& operator=(const KeyEvent&) = delete;

	/// The event type with the "sent by SendEvent request" bit masked out.
	uint8_t type() const {
		return m_event.response_type & ~0x80;
	}

	bool isPress() const { return type() == XCB_KEY_PRESS; }
	bool isRelease() const { return type() == XCB_KEY_RELEASE; }

	xcb_keycode_t keycode() const { return m_event.detail; }
	/// The modifier and button mask at the time of the event.
	uint16_t state() const { return m_event.state; }
	xcb_timestamp_t time() const { return m_event.time; }
	/// The window the event was reported for.
	xcb_window_t window() const { return m_event.event; }

	const xcb_key_press_event_t& raw() const { return m_event; }

protected: // data

	const xcb_key_press_event_t &m_event;
};

} // end ns
