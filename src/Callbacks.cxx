// ximc
#include "Callbacks.hxx"
#include "KeyEvent.hxx"
#include "PreeditInfo.hxx"
#include "TextDecoder.hxx"

namespace ximc {

// NOTE: the handlers are invoked via a copy, since a handler that replaces
// itself would otherwise destroy the function object that is executing.

void Callbacks::commitString(const xcb_window_t win, const std::string_view text) const {
	if (!m_commit_string)
		return;

	// only decode if somebody is interested in the result
	const auto utf8 = m_decoder.toUTF8(text);
	auto cb = m_commit_string;
	cb(win, utf8);
}

void Callbacks::forwardEvent(const xcb_window_t win, const xcb_key_press_event_t &event) const {
	if (!m_forward_event)
		return;

	const KeyEvent view{event};
	auto cb = m_forward_event;
	cb(win, view);
}

void Callbacks::preeditStart(const xcb_window_t win) const {
	if (!m_preedit_start)
		return;

	auto cb = m_preedit_start;
	cb(win);
}

void Callbacks::preeditDraw(const xcb_window_t win, const PreeditFrame &frame) const {
	if (!m_preedit_draw)
		return;

	const PreeditInfo info{frame, m_decoder};
	auto cb = m_preedit_draw;
	cb(win, info);
}

void Callbacks::preeditDone(const xcb_window_t win) const {
	if (!m_preedit_done)
		return;

	auto cb = m_preedit_done;
	cb(win);
}

} // end ns
