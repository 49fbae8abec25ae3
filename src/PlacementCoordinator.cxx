// ximc
#include "ContextLifecycle.hxx"
#include "PlacementCoordinator.hxx"
#include "ProtocolEngine.hxx"

namespace ximc {

bool PlacementCoordinator::request(const Placement &placement) {
	m_requested = placement;

	const auto ctx = m_lifecycle.context();

	if (!ctx) {
		m_lifecycle.ensureOpen();
		return false;
	} else if (m_in_flight) {
		m_update_pending = true;
		return false;
	}

	return send(*ctx);
}

void PlacementCoordinator::updateDone(const ContextID ctx) {
	if (m_lifecycle.context() != ctx) {
		m_logger.debug() << "dropping placement acknowledgement for stale context " << raw_ctx(ctx) << "\n";
		return;
	}

	if (m_update_pending) {
		m_update_pending = false;
		send(ctx);
	} else {
		m_in_flight = false;
	}
}

bool PlacementCoordinator::send(const ContextID ctx) {
	ContextAttributes attrs;
	attrs.spot = m_requested.spot();

	if (!m_requested.sameWindow(m_current)) {
		attrs.client_window = m_requested.window;
		attrs.focus_window = m_requested.window;
	}

	m_in_flight = true;

	if (!m_engine.setContextValues(ctx, attrs)) {
		m_logger.warn() << "failed to send placement update for input context " << raw_ctx(ctx) << "\n";
		m_in_flight = false;
		return false;
	}

	m_current = m_requested;
	return true;
}

} // end ns
