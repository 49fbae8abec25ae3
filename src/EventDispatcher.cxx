// ximc
#include "ContextLifecycle.hxx"
#include "EventDispatcher.hxx"
#include "ProtocolEngine.hxx"

namespace ximc {

namespace {
	// events generated via SendEvent requests carry this bit
	constexpr uint8_t SEND_EVENT_MASK = 0x80;
}

bool EventDispatcher::isKeyEvent(const xcb_generic_event_t &event) {
	const auto type = event.response_type & ~SEND_EVENT_MASK;
	return type == XCB_KEY_PRESS || type == XCB_KEY_RELEASE;
}

bool EventDispatcher::process(const xcb_generic_event_t &event) {
	if (m_engine.filterEvent(event))
		return true;
	else if (!isKeyEvent(event))
		return false;

	if (const auto ctx = m_lifecycle.context(); ctx) {
		// key press and release events share the same layout
		const auto &key = reinterpret_cast<const xcb_key_press_event_t&>(event);
		if (!m_engine.forwardEvent(*ctx, key)) {
			m_logger.warn() << "failed to forward key event to input context " << raw_ctx(*ctx) << "\n";
		}

		// the keystroke belongs to the input method now
		return true;
	}

	m_lifecycle.ensureOpen();
	return false;
}

} // end ns
