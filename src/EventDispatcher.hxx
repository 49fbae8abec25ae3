#pragma once

// cosmos
#include "cosmos/io/ILogger.hxx"

// XCB
#include <xcb/xproto.h>

// ximc
#include "fwd.hxx"

namespace ximc {

/// Decides whether the input method or the application handles an event.
class EventDispatcher {
public: // functions

	EventDispatcher(ProtocolEngine &engine, ContextLifecycle &lifecycle, cosmos::ILogger &logger) :
			m_engine{engine},
			m_lifecycle{lifecycle},
			m_logger{logger}
	{}

	/// Processes a single event from the application's event queue.
	/**
	 * Events consumed by the protocol engine are handled. Key events
	 * are forwarded to the server if an input context exists and are
	 * handled as well, even if the forward request could not be issued.
	 * Otherwise key events trigger context creation and remain with the
	 * application, keystrokes are not buffered while the context comes up.
	 *
	 * \return \c true if the event has been handled and the application
	 * must ignore it.
	 **/
	bool process(const xcb_generic_event_t &event);

	/// Returns whether the event is a key press or key release.
	static bool isKeyEvent(const xcb_generic_event_t &event);

protected: // data

	ProtocolEngine &m_engine;
	ContextLifecycle &m_lifecycle;
	cosmos::ILogger &m_logger;
};

} // end ns
