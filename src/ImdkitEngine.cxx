// libc
#include <stdarg.h>
#include <stdio.h>

// C++
#include <cstdlib>
#include <mutex>
#include <string>

// cosmos
#include "cosmos/error/RuntimeError.hxx"

// xcb-imdkit
#include <xcb-imdkit/encoding.h>

// ximc
#include "ImdkitEngine.hxx"
#include "log.hxx"
#include "Settings.hxx"

namespace ximc {

namespace {

	/// Formats printf-style diagnostics from xcb-imdkit for the process wide sink.
	void log_handler(const char *fmt, ...) {
		if (!log::installed())
			return;

		va_list args;
		va_start(args, fmt);
		va_list args_copy;
		va_copy(args_copy, args);
		const auto len = vsnprintf(nullptr, 0, fmt, args_copy);
		va_end(args_copy);

		std::string line;
		if (len > 0) {
			line.resize(static_cast<size_t>(len) + 1);
			vsnprintf(line.data(), line.size(), fmt, args);
			line.resize(static_cast<size_t>(len));
		}
		va_end(args);

		log::write(line);
	}

	/// The nested spot location list used as XNPreeditAttributes value.
	class SpotList {
	public: // functions

		SpotList(xcb_xim_t *im, const Spot spot) :
				m_point{spot.x, spot.y} {
			m_list = xcb_xim_create_nested_list(im, XCB_XIM_XNSpotLocation, &m_point, nullptr);
		}

		~SpotList() {
			std::free(m_list.data);
		}

		SpotList(const SpotList&) = delete;
		SpotList& operator=(const SpotList&) = delete;

		xcb_xim_nested_list* list() { return &m_list; }

	protected: // data

		xcb_point_t m_point;
		xcb_xim_nested_list m_list;
	};

	xcb_xic_t to_xic(const ContextID ctx) {
		return xcb_xic_t{raw_ctx(ctx)};
	}

	ContextID to_ctx(const xcb_xic_t ic) {
		return ContextID{static_cast<uint16_t>(ic)};
	}

	std::once_flag compound_text_init;

} // end anon ns

ImdkitEngine::ImdkitEngine(xcb_connection_t &conn, const int screen_id, const Settings &settings) {
	std::call_once(compound_text_init, xcb_compound_text_init);

	m_im = xcb_xim_create(&conn, screen_id,
			settings.im_name ? settings.im_name->c_str() : nullptr);

	if (!m_im) {
		throw cosmos::RuntimeError{"xcb_xim_create() failed"};
	}

	xcb_xim_im_callback callbacks{};
	callbacks.disconnected = &disconnectedCB;
	callbacks.commit_string = &commitStringCB;
	callbacks.forward_event = &forwardEventCB;
	callbacks.preedit_start = &preeditStartCB;
	callbacks.preedit_draw = &preeditDrawCB;
	callbacks.preedit_done = &preeditDoneCB;

	xcb_xim_set_im_callback(m_im, &callbacks, this);
	xcb_xim_set_log_handler(m_im, &log_handler);
	xcb_xim_set_use_compound_text(m_im, settings.use_compound_text);
	xcb_xim_set_use_utf8_string(m_im, settings.use_utf8_string);
}

ImdkitEngine::~ImdkitEngine() {
	m_listener = nullptr;
	xcb_xim_destroy(m_im);
}

bool ImdkitEngine::open() {
	if (m_method_open) {
		// the server connection is still there, only a new context is
		// needed, report completion right away
		notify(notify::MethodOpened{});
		return true;
	}

	return xcb_xim_open(m_im, &openCB, /*auto_connect=*/true, this);
}

bool ImdkitEngine::createContext(const ContextAttributes &attrs) {
	uint32_t style = attrs.style ? attrs.style->raw() : 0;
	xcb_window_t client = attrs.client_window.value_or(XCB_WINDOW_NONE);
	xcb_window_t focus = attrs.focus_window.value_or(client);
	SpotList spot{m_im, attrs.spot.value_or(Spot{})};

	// NOTE: this function takes varargs, all values need to be passed as
	// pointers to plain C types
	return xcb_xim_create_ic(m_im, &createContextCB, this,
			XCB_XIM_XNInputStyle, &style,
			XCB_XIM_XNClientWindow, &client,
			XCB_XIM_XNFocusWindow, &focus,
			XCB_XIM_XNPreeditAttributes, spot.list(),
			nullptr);
}

bool ImdkitEngine::setContextValues(const ContextID ctx, const ContextAttributes &attrs) {
	SpotList spot{m_im, attrs.spot.value_or(Spot{})};

	// only the two attribute combinations used for placement updates are
	// supported: spot location alone or together with the target window
	if (attrs.client_window) {
		xcb_window_t client = *attrs.client_window;
		xcb_window_t focus = attrs.focus_window.value_or(client);

		return xcb_xim_set_ic_values(m_im, to_xic(ctx), &setValuesCB, this,
				XCB_XIM_XNClientWindow, &client,
				XCB_XIM_XNFocusWindow, &focus,
				XCB_XIM_XNPreeditAttributes, spot.list(),
				nullptr);
	}

	return xcb_xim_set_ic_values(m_im, to_xic(ctx), &setValuesCB, this,
			XCB_XIM_XNPreeditAttributes, spot.list(),
			nullptr);
}

bool ImdkitEngine::setContextFocus(const ContextID ctx) {
	return xcb_xim_set_ic_focus(m_im, to_xic(ctx));
}

bool ImdkitEngine::filterEvent(const xcb_generic_event_t &event) {
	// the library doesn't modify the event, it's just not const correct
	return xcb_xim_filter_event(m_im, const_cast<xcb_generic_event_t*>(&event));
}

bool ImdkitEngine::forwardEvent(const ContextID ctx, const xcb_key_press_event_t &event) {
	return xcb_xim_forward_event(m_im, to_xic(ctx), const_cast<xcb_key_press_event_t*>(&event));
}

bool ImdkitEngine::destroyContext(const ContextID ctx) {
	return xcb_xim_destroy_ic(m_im, to_xic(ctx), nullptr, nullptr);
}

void ImdkitEngine::close() {
	xcb_xim_close(m_im);
	m_method_open = false;
}

TextEncoding ImdkitEngine::encoding() const {
	if (xcb_xim_get_encoding(m_im) == XCB_XIM_UTF8_STRING)
		return TextEncoding::UTF8_STRING;

	return TextEncoding::COMPOUND_TEXT;
}

char* ImdkitEngine::compoundTextToUTF8(const char *text, const size_t length, size_t *out_length) const {
	return xcb_compound_text_to_utf8(text, length, out_length);
}

void ImdkitEngine::openCB(xcb_xim_t *, void *user_data) {
	auto &engine = fromUserData(user_data);
	engine.m_method_open = true;
	engine.notify(notify::MethodOpened{});
}

void ImdkitEngine::disconnectedCB(xcb_xim_t *, void *user_data) {
	auto &engine = fromUserData(user_data);
	engine.m_method_open = false;
	engine.notify(notify::Disconnected{});
}

void ImdkitEngine::createContextCB(xcb_xim_t *, xcb_xic_t ic, void *user_data) {
	// a zero context ID is reported if the request failed
	fromUserData(user_data).notify(notify::ContextCreated{to_ctx(ic)});
}

void ImdkitEngine::setValuesCB(xcb_xim_t *, xcb_xic_t ic, void *user_data) {
	fromUserData(user_data).notify(notify::ContextValuesSet{to_ctx(ic)});
}

void ImdkitEngine::commitStringCB(xcb_xim_t *, xcb_xic_t ic, uint32_t, char *str,
		uint32_t length, uint32_t *, size_t, void *user_data) {
	const std::string_view text = str ? std::string_view{str, length} : std::string_view{};
	fromUserData(user_data).notify(notify::CommitString{to_ctx(ic), text});
}

void ImdkitEngine::forwardEventCB(xcb_xim_t *, xcb_xic_t ic, xcb_key_press_event_t *event, void *user_data) {
	fromUserData(user_data).notify(notify::ForwardEvent{to_ctx(ic), event});
}

void ImdkitEngine::preeditStartCB(xcb_xim_t *, xcb_xic_t ic, void *user_data) {
	fromUserData(user_data).notify(notify::PreeditStart{to_ctx(ic)});
}

void ImdkitEngine::preeditDrawCB(xcb_xim_t *, xcb_xic_t ic, xcb_im_preedit_draw_fr_t *frame, void *user_data) {
	PreeditFrame info;
	info.status = frame->status;
	info.caret = static_cast<int32_t>(frame->caret);
	info.chg_first = static_cast<int32_t>(frame->chg_first);
	info.chg_length = static_cast<int32_t>(frame->chg_length);
	if (frame->preedit_string) {
		info.text = std::string_view{
			reinterpret_cast<const char*>(frame->preedit_string),
			frame->length_of_preedit_string};
	}
	info.feedback = frame->feedback_array.items;
	info.num_feedback = frame->feedback_array.size;

	fromUserData(user_data).notify(notify::PreeditDraw{to_ctx(ic), &info});
}

void ImdkitEngine::preeditDoneCB(xcb_xim_t *, xcb_xic_t ic, void *user_data) {
	fromUserData(user_data).notify(notify::PreeditDone{to_ctx(ic)});
}

} // end ns
