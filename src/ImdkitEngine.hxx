#pragma once

// XCB
#include <xcb/xcb.h>

// xcb-imdkit
#include <xcb-imdkit/imclient.h>

// ximc
#include "fwd.hxx"
#include "ProtocolEngine.hxx"

namespace ximc {

/// ProtocolEngine implementation based on the xcb-imdkit library.
/**
 * xcb-imdkit implements the client side of the XIM protocol on top of an
 * XCB connection. Its C callbacks receive this object as user data and
 * translate the callback parameters into typed notifications for the
 * installed EngineListener.
 *
 * Diagnostics of the library are passed on to the process wide log sink
 * (see log.hxx).
 *
 * The object must not be moved after construction, since the library keeps
 * a pointer to it.
 **/
class ImdkitEngine :
		public ProtocolEngine {
public: // functions

	/// Create a new protocol handle for the given connection.
	/**
	 * The connection needs to outlive this object. Only the im_name and
	 * text encoding fields of \c settings are evaluated.
	 *
	 * Throws cosmos::RuntimeError if the protocol handle can't be
	 * created.
	 **/
	ImdkitEngine(xcb_connection_t &conn, const int screen_id, const Settings &settings);

	~ImdkitEngine() override;

	ImdkitEngine(const ImdkitEngine&) = delete;
	ImdkitEngine& operator=(const ImdkitEngine&) = delete;

	void setListener(EngineListener *listener) override {
		m_listener = listener;
	}

	bool open() override;
	bool createContext(const ContextAttributes &attrs) override;
	bool setContextValues(const ContextID ctx, const ContextAttributes &attrs) override;
	bool setContextFocus(const ContextID ctx) override;
	bool filterEvent(const xcb_generic_event_t &event) override;
	bool forwardEvent(const ContextID ctx, const xcb_key_press_event_t &event) override;
	bool destroyContext(const ContextID ctx) override;
	void close() override;
	TextEncoding encoding() const override;
	char* compoundTextToUTF8(const char *text, const size_t length, size_t *out_length) const override;

protected: // functions

	void notify(const Notification &notification) {
		if (m_listener) {
			m_listener->notify(notification);
		}
	}

	static ImdkitEngine& fromUserData(void *user_data) {
		return *reinterpret_cast<ImdkitEngine*>(user_data);
	}

	static void openCB(xcb_xim_t *im, void *user_data);
	static void disconnectedCB(xcb_xim_t *im, void *user_data);
	static void createContextCB(xcb_xim_t *im, xcb_xic_t ic, void *user_data);
	static void setValuesCB(xcb_xim_t *im, xcb_xic_t ic, void *user_data);
	static void commitStringCB(xcb_xim_t *im, xcb_xic_t ic, uint32_t flag, char *str,
			uint32_t length, uint32_t *keysym, size_t num_keysym, void *user_data);
	static void forwardEventCB(xcb_xim_t *im, xcb_xic_t ic, xcb_key_press_event_t *event, void *user_data);
	static void preeditStartCB(xcb_xim_t *im, xcb_xic_t ic, void *user_data);
	static void preeditDrawCB(xcb_xim_t *im, xcb_xic_t ic, xcb_im_preedit_draw_fr_t *frame, void *user_data);
	static void preeditDoneCB(xcb_xim_t *im, xcb_xic_t ic, void *user_data);

protected: // data

	xcb_xim_t *m_im = nullptr;
	EngineListener *m_listener = nullptr;
	bool m_method_open = false; ///< whether the server connection is established
};

} // end ns
