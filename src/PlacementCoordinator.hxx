#pragma once

// cosmos
#include "cosmos/io/ILogger.hxx"

// ximc
#include "fwd.hxx"
#include "types.hxx"

namespace ximc {

/// Keeps the server informed about the candidate window placement.
/**
 * Continuous placement changes (e.g. while dragging a window) would
 * otherwise cause one protocol round trip per pixel of movement. This type
 * allows at most one update to be in flight per input context. Requests
 * arriving meanwhile are coalesced, only the newest one is sent once the
 * in-flight update has been acknowledged.
 *
 * Two placements are tracked: the requested placement is the last one the
 * application asked for, the current placement is the last one that has
 * been sent to the server. The current placement is updated when a send is
 * issued, not when it is acknowledged, so that changes of the target window
 * are detected against what has actually been sent.
 **/
class PlacementCoordinator {
public: // functions

	PlacementCoordinator(ProtocolEngine &engine, ContextLifecycle &lifecycle, cosmos::ILogger &logger) :
			m_engine{engine},
			m_lifecycle{lifecycle},
			m_logger{logger}
	{}

	/// Record a new placement and send it if possible.
	/**
	 * If no input context exists yet, context creation is triggered
	 * instead. The new context is created using the requested placement
	 * valid at that time.
	 *
	 * \return \c true if the update has been sent right away, \c false
	 * if it has been deferred.
	 **/
	bool request(const Placement &placement);

	/// Acknowledgement of an update by the server.
	void updateDone(const ContextID ctx);

	/// The requested placement has been used to request a new input context.
	void creationSent() {
		m_current = m_requested;
	}

	/// A new input context exists, it has no outstanding updates.
	void contextOpened() {
		m_in_flight = false;
		m_update_pending = false;
	}

	const Placement& current() const { return m_current; }
	const Placement& requested() const { return m_requested; }
	bool inFlight() const { return m_in_flight; }
	bool updatePending() const { return m_update_pending; }

protected: // functions

	/// Sends the requested placement to the server.
	/**
	 * The target window attributes are only included if the window
	 * differs from the last sent one.
	 *
	 * \return Whether the update could be issued.
	 **/
	bool send(const ContextID ctx);

protected: // data

	ProtocolEngine &m_engine;
	ContextLifecycle &m_lifecycle;
	cosmos::ILogger &m_logger;
	Placement m_current;
	Placement m_requested;
	bool m_in_flight = false; ///< an update awaits acknowledgement by the server
	bool m_update_pending = false; ///< a newer request arrived while m_in_flight was set
};

} // end ns
