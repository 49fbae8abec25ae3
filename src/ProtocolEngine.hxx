#pragma once

// C++
#include <cstdlib>
#include <optional>

// XCB
#include <xcb/xproto.h>

// ximc
#include "Notification.hxx"
#include "types.hxx"

namespace ximc {

/// Input context attributes for context creation or value updates.
/**
 * Only attributes that are set are transmitted to the server.
 **/
struct ContextAttributes {
	std::optional<InputStyle> style;
	std::optional<xcb_window_t> client_window;
	std::optional<xcb_window_t> focus_window;
	std::optional<Spot> spot; ///< transmitted as nested preedit attribute
};

/// Receiver of all asynchronous ProtocolEngine notifications.
class EngineListener {
public: // functions

	virtual ~EngineListener() {}

	/// Single entry point for every notification kind.
	/**
	 * This is invoked synchronously from within the engine, typically
	 * nested in a filterEvent() call, but possibly also nested in any
	 * other request function.
	 **/
	virtual void notify(const Notification &notification) = 0;
};

/// Interface towards the native input method protocol implementation.
/**
 * The engine implements the XIM wire protocol and the transport. All
 * requests are asynchronous: the return value only tells whether a request
 * could be issued, its result is reported later on via the installed
 * EngineListener.
 *
 * For a single input context completions are reported in request order.
 **/
class ProtocolEngine {
public: // functions

	virtual ~ProtocolEngine() {}

	/// Installs the receiver for notifications, nullptr stops all notifications.
	virtual void setListener(EngineListener *listener) = 0;

	/// Request a connection to the input method server.
	/**
	 * Success is reported via notify::MethodOpened.
	 **/
	virtual bool open() = 0;

	/// Request a new input context, completed via notify::ContextCreated.
	virtual bool createContext(const ContextAttributes &attrs) = 0;

	/// Request changed context attributes, completed via notify::ContextValuesSet.
	virtual bool setContextValues(const ContextID ctx, const ContextAttributes &attrs) = 0;

	/// Let the given context receive input focus.
	virtual bool setContextFocus(const ContextID ctx) = 0;

	/// Inspects the given event for protocol traffic.
	/**
	 * \return \c true if the event was consumed by the engine.
	 **/
	virtual bool filterEvent(const xcb_generic_event_t &event) = 0;

	/// Pass a key event to the server for composition.
	virtual bool forwardEvent(const ContextID ctx, const xcb_key_press_event_t &event) = 0;

	/// Request destruction of the given context.
	/**
	 * No completion is reported, the return value only tells whether the
	 * request could be issued.
	 **/
	virtual bool destroyContext(const ContextID ctx) = 0;

	/// Close the connection to the input method server.
	virtual void close() = 0;

	/// Returns the text encoding negotiated with the server.
	virtual TextEncoding encoding() const = 0;

	/// Converts Compound Text into UTF-8.
	/**
	 * \return A newly allocated buffer that needs to be passed to
	 * releaseConverted(), or nullptr on conversion errors.
	 * \param[out] out_length the number of bytes in the returned buffer.
	 **/
	virtual char* compoundTextToUTF8(const char *text, const size_t length, size_t *out_length) const = 0;

	/// Releases a buffer returned from compoundTextToUTF8().
	virtual void releaseConverted(char *buffer) const {
		std::free(buffer);
	}
};

} // end ns
