#pragma once

// C++
#include <functional>
#include <string_view>

// XCB
#include <xcb/xproto.h>

// ximc
#include "fwd.hxx"

namespace ximc {

/// Registry of the user supplied notification handlers.
/**
 * Every slot is optional, notifications for unset slots are dropped
 * silently. Each handler receives the window of the last requested
 * placement as its first argument.
 *
 * Handlers may replace any handler, including themselves, while they are
 * executing.
 **/
class Callbacks {
public: // types

	/// Receives the final text of a composition.
	using CommitStringCB = std::function<void (xcb_window_t, const std::string_view)>;
	/// Receives key events not used for composition.
	using ForwardEventCB = std::function<void (xcb_window_t, const KeyEvent&)>;
	/// Receives changes of the text being composed.
	using PreeditDrawCB = std::function<void (xcb_window_t, const PreeditInfo&)>;
	/// Used for preedit start and done.
	using NotifyCB = std::function<void (xcb_window_t)>;

public: // functions

	explicit Callbacks(const TextDecoder &decoder) :
			m_decoder{decoder} {}

	void setCommitString(CommitStringCB cb) { m_commit_string = std::move(cb); }
	void setForwardEvent(ForwardEventCB cb) { m_forward_event = std::move(cb); }
	void setPreeditStart(NotifyCB cb) { m_preedit_start = std::move(cb); }
	void setPreeditDraw(PreeditDrawCB cb) { m_preedit_draw = std::move(cb); }
	void setPreeditDone(NotifyCB cb) { m_preedit_done = std::move(cb); }

	/// Decodes \c text and passes it to the commit string handler, if set.
	void commitString(const xcb_window_t win, const std::string_view text) const;
	void forwardEvent(const xcb_window_t win, const xcb_key_press_event_t &event) const;
	void preeditStart(const xcb_window_t win) const;
	void preeditDraw(const xcb_window_t win, const PreeditFrame &frame) const;
	void preeditDone(const xcb_window_t win) const;

protected: // data

	const TextDecoder &m_decoder;
	CommitStringCB m_commit_string;
	ForwardEventCB m_forward_event;
	NotifyCB m_preedit_start;
	PreeditDrawCB m_preedit_draw;
	NotifyCB m_preedit_done;
};

} // end ns
