#pragma once

// C++
#include <optional>

// cosmos
#include "cosmos/io/ILogger.hxx"

// ximc
#include "fwd.hxx"
#include "types.hxx"

namespace ximc {

/// Tracks the server side input context and opens it on demand.
/**
 * The lifecycle follows the states NO_CONTEXT -> OPENING -> OPEN. A server
 * disconnect returns to NO_CONTEXT from any state. Failed open or creation
 * requests also return to NO_CONTEXT, there is no background retry:
 * the next operation that needs a context calls ensureOpen() again.
 **/
class ContextLifecycle {
public: // types

	enum class State {
		NO_CONTEXT, ///< no context exists and none has been requested
		OPENING,    ///< server connection or context creation is in progress
		OPEN        ///< a context exists and has input focus
	};

public: // functions

	ContextLifecycle(ProtocolEngine &engine, const InputStyle style, cosmos::ILogger &logger) :
			m_engine{engine},
			m_style{style},
			m_logger{logger}
	{}

	/// Request a new context unless one exists or is already being opened.
	void ensureOpen();

	/// The server connection is up, request the input context.
	/**
	 * \c requested provides the client window and spot location for the
	 * new context.
	 *
	 * \return Whether the creation request has been issued.
	 **/
	bool methodOpened(const Placement &requested);

	/// Completion of the context creation request.
	/**
	 * Replies that arrive outside of the OPENING state are ignored.
	 *
	 * \return Whether a new context has been opened.
	 **/
	bool contextCreated(const ContextID ctx);

	/// The server connection has been lost.
	void disconnected();

	/// Destroys an open context, used during teardown.
	void destroy();

	State state() const { return m_state; }

	bool isOpen() const { return m_state == State::OPEN; }

	std::optional<ContextID> context() const {
		if (!isOpen())
			return std::nullopt;

		return m_ctx;
	}

protected: // data

	ProtocolEngine &m_engine;
	const InputStyle m_style;
	cosmos::ILogger &m_logger;
	State m_state = State::NO_CONTEXT;
	ContextID m_ctx = ContextID::INVALID;
};

} // end ns
