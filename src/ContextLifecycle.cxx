// ximc
#include "ContextLifecycle.hxx"
#include "ProtocolEngine.hxx"

namespace ximc {

void ContextLifecycle::ensureOpen() {
	if (m_state != State::NO_CONTEXT)
		return;

	// the engine may complete the request synchronously, so change state first
	m_state = State::OPENING;

	if (!m_engine.open()) {
		m_logger.warn() << "input method open request failed, retrying on next use\n";
		m_state = State::NO_CONTEXT;
	}
}

bool ContextLifecycle::methodOpened(const Placement &requested) {
	if (m_state != State::OPENING) {
		m_logger.debug() << "ignoring unsolicited input method open notification\n";
		return false;
	}

	ContextAttributes attrs;
	attrs.style = m_style;
	attrs.client_window = requested.window;
	attrs.focus_window = requested.window;
	attrs.spot = requested.spot();

	if (!m_engine.createContext(attrs)) {
		m_logger.warn() << "input context creation request failed, retrying on next use\n";
		m_state = State::NO_CONTEXT;
		return false;
	}

	return true;
}

bool ContextLifecycle::contextCreated(const ContextID ctx) {
	if (m_state != State::OPENING) {
		// e.g. the reply of a connection that has been lost meanwhile
		m_logger.debug() << "ignoring unsolicited input context " << raw_ctx(ctx) << "\n";
		return false;
	} else if (ctx == ContextID::INVALID) {
		m_logger.warn() << "input method server failed to create an input context, retrying on next use\n";
		m_state = State::NO_CONTEXT;
		return false;
	}

	m_ctx = ctx;
	m_state = State::OPEN;
	m_logger.debug() << "input context " << raw_ctx(ctx) << " created\n";

	if (!m_engine.setContextFocus(ctx)) {
		m_logger.warn() << "failed to focus input context " << raw_ctx(ctx) << "\n";
	}

	return true;
}

void ContextLifecycle::disconnected() {
	if (m_state != State::NO_CONTEXT) {
		m_logger.debug() << "input method server disconnected\n";
	}

	m_ctx = ContextID::INVALID;
	m_state = State::NO_CONTEXT;
}

void ContextLifecycle::destroy() {
	if (isOpen() && !m_engine.destroyContext(m_ctx)) {
		m_logger.warn() << "failed to destroy input context " << raw_ctx(m_ctx) << "\n";
	}

	m_ctx = ContextID::INVALID;
	m_state = State::NO_CONTEXT;
}

} // end ns
