#pragma once

// C++
#include <memory>
#include <optional>
#include <string>

// XCB
#include <xcb/xcb.h>

// cosmos
#include "cosmos/io/ILogger.hxx"

// ximc
#include "Callbacks.hxx"
#include "ContextLifecycle.hxx"
#include "EventDispatcher.hxx"
#include "fwd.hxx"
#include "log.hxx"
#include "PlacementCoordinator.hxx"
#include "ProtocolEngine.hxx"
#include "TextDecoder.hxx"
#include "types.hxx"

namespace ximc {

/// X Input Method client.
/**
 * A Client represents one connection to an input method server. It
 * provides callbacks for composition results and control over the position
 * of the input method's candidate window. There should be only one Client
 * per application.
 *
 * The protocol engine keeps a reference to the Client for delivering its
 * asynchronous notifications. Therefore Clients are only available on the
 * heap via create() and can neither be copied nor moved.
 *
 * All functions need to be called from the thread running the
 * application's event loop. Notifications from the server are processed
 * synchronously, nested in processEvent() or requestPlacement().
 **/
class Client :
		public EngineListener {
public: // functions

	/// Create a new Client for the given XCB connection.
	/**
	 * The connection and \c logger need to outlive the Client.
	 * \c im_name can be used to specify a custom server to connect to
	 * using the syntax `@im=custom_server`.
	 **/
	static std::unique_ptr<Client> create(
			xcb_connection_t &conn, const int screen_id,
			const InputStyle style, cosmos::ILogger &logger,
			const std::optional<std::string> &im_name = std::nullopt);

	/// Create a new Client from runtime settings.
	static std::unique_ptr<Client> create(
			xcb_connection_t &conn, const int screen_id,
			const Settings &settings, cosmos::ILogger &logger);

	/// Create a new Client operating on the given protocol engine.
	static std::unique_ptr<Client> create(
			std::unique_ptr<ProtocolEngine> engine,
			const InputStyle style, cosmos::ILogger &logger);

	~Client() override;

	Client(const Client&) = delete;
	Client& operator=(const Client&) = delete;

	/// Set the process wide handler for protocol library diagnostics.
	static void setLogger(log::Handler handler) {
		log::install(std::move(handler));
	}

	/// Let the input method process an event from the event queue.
	/**
	 * This needs to be called for *any* event, not just for key events,
	 * since protocol traffic is transported via X events, too.
	 *
	 * Key events are passed to the server for composition once an input
	 * context exists. Key events not used for composition are reported
	 * back via the forward event callback. Often those include all key
	 * release events as well as the events for `ESC`, `Enter` or key
	 * combinations such as `CTRL+C`.
	 *
	 * \return \c true if the event has been handled, \c false if it has
	 * to be handled by the application.
	 **/
	bool processEvent(const xcb_generic_event_t &event) {
		return m_dispatcher.process(event);
	}

	/// Set the position of the input method window relative to \c win.
	/**
	 * Coordinates increase from the top left corner of the window.
	 *
	 * \return \c true if the update has been sent to the server, \c false
	 * if it has been deferred. A deferred request replaces any previously
	 * deferred request.
	 **/
	bool requestPlacement(const xcb_window_t win, const int16_t x, const int16_t y) {
		return m_placement.request(Placement{win, x, y});
	}

	/// Called once composition is done with the completed text.
	void setCommitStringCB(Callbacks::CommitStringCB cb) {
		m_callbacks.setCommitString(std::move(cb));
	}

	/// Called for key events the input method didn't use.
	/**
	 * Key release events are reported, too.
	 **/
	void setForwardEventCB(Callbacks::ForwardEventCB cb) {
		m_callbacks.setForwardEvent(std::move(cb));
	}

	/// Called when composition starts.
	/**
	 * Only invoked if InputStyleFlag::PREEDIT_CALLBACKS is set.
	 **/
	void setPreeditStartCB(Callbacks::NotifyCB cb) {
		m_callbacks.setPreeditStart(std::move(cb));
	}

	/// Called whenever the text being composed changes.
	/**
	 * Only invoked if InputStyleFlag::PREEDIT_CALLBACKS is set.
	 **/
	void setPreeditDrawCB(Callbacks::PreeditDrawCB cb) {
		m_callbacks.setPreeditDraw(std::move(cb));
	}

	/// Called when composition ends.
	/**
	 * Only invoked if InputStyleFlag::PREEDIT_CALLBACKS is set.
	 **/
	void setPreeditDoneCB(Callbacks::NotifyCB cb) {
		m_callbacks.setPreeditDone(std::move(cb));
	}

	bool hasContext() const { return m_lifecycle.isOpen(); }
	const Placement& currentPlacement() const { return m_placement.current(); }
	const Placement& requestedPlacement() const { return m_placement.requested(); }
	InputStyle inputStyle() const { return m_style; }

protected: // functions

	Client(std::unique_ptr<ProtocolEngine> engine, const InputStyle style, cosmos::ILogger &logger);

	void notify(const Notification &notification) override;

	void handle(const notify::MethodOpened &);
	void handle(const notify::Disconnected &);
	void handle(const notify::ContextCreated &);
	void handle(const notify::ContextValuesSet &);
	void handle(const notify::CommitString &);
	void handle(const notify::ForwardEvent &);
	void handle(const notify::PreeditStart &);
	void handle(const notify::PreeditDraw &);
	void handle(const notify::PreeditDone &);

	bool usePreeditCallbacks() const {
		return m_style[InputStyleFlag::PREEDIT_CALLBACKS];
	}

	/// The window passed to callbacks.
	xcb_window_t targetWindow() const {
		return m_placement.requested().window;
	}

protected: // data

	// the engine needs to be destroyed last, see ~Client()
	std::unique_ptr<ProtocolEngine> m_engine;
	cosmos::ILogger &m_logger;
	const InputStyle m_style;
	TextDecoder m_decoder;
	ContextLifecycle m_lifecycle;
	PlacementCoordinator m_placement;
	EventDispatcher m_dispatcher;
	Callbacks m_callbacks;
};

} // end ns
