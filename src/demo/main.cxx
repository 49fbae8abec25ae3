// C++
#include <cstdlib>
#include <iostream>
#include <memory>

// XCB
#include <xcb/xcb.h>

// TCLAP
#include "tclap/CmdLine.h"

// cosmos
#include "cosmos/error/RuntimeError.hxx"
#include "cosmos/io/StdLogger.hxx"
#include "cosmos/main.hxx"
#include "cosmos/proc/process.hxx"

// ximc
#include "Client.hxx"
#include "ConfigFile.hxx"
#include "KeyEvent.hxx"
#include "PreeditInfo.hxx"
#include "Settings.hxx"

namespace ximc {

/// Command line parser for the demo program.
class Cmdline :
		public TCLAP::CmdLine {
public: // functions

	Cmdline();

public: // data

	TCLAP::ValueArg<std::string> im_name;
	TCLAP::SwitchArg preedit;
	TCLAP::ValueArg<std::string> config_file;
	TCLAP::SwitchArg debug;
};

Cmdline::Cmdline() :
		TCLAP::CmdLine{"X input method client demo", ' ', XIMC_VERSION},
		im_name    {"i", "im", "connect to the given input method server, e.g. '@im=fcitx'", false, "", "server name", *this},
		preedit    {"p", "preedit", "display the text being composed via preedit callbacks", *this, false},
		config_file{"c", "config", "additional configuration file to parse", false, "", "path", *this},
		debug      {"d", "debug", "print protocol diagnostics", *this, false}
{}

/// Small XCB application showing the input method callbacks on stdout.
class Demo :
		public cosmos::MainPlainArgs {
public: // functions

	~Demo() {
		disconnect();
	}

protected: // functions

	cosmos::ExitStatus main(const int argc, const char **argv) override;

	void loadSettings();
	void connect();
	void createWindow();
	void setupClient();
	void eventLoop();
	void disconnect();

	/// Handles an event the input method didn't process.
	/**
	 * \return \c false if the program should exit.
	 **/
	bool handleEvent(const xcb_generic_event_t &event);

protected: // types

	struct FreeDeleter {
		void operator()(void *ptr) const { std::free(ptr); }
	};

protected: // data

	Cmdline m_cmdline;
	mutable cosmos::StdLogger m_logger;
	Settings m_settings;
	xcb_connection_t *m_conn = nullptr;
	int m_screen_nr = 0;
	xcb_window_t m_window = XCB_WINDOW_NONE;
	std::unique_ptr<Client> m_client;
};

cosmos::ExitStatus Demo::main(const int argc, const char **argv) {
	m_cmdline.parse(argc, argv);

	loadSettings();
	connect();
	createWindow();
	setupClient();
	eventLoop();

	return cosmos::ExitStatus::SUCCESS;
}

void Demo::loadSettings() {
	ConfigFile config{m_logger};

	config.parse("/etc/ximc.conf");
	if (auto home = cosmos::proc::get_env_var("HOME"); home != std::nullopt) {
		config.parse(home->str() + "/.config/ximc.conf");
	}
	if (m_cmdline.config_file.isSet()) {
		const auto &path = m_cmdline.config_file.getValue();
		if (!config.parse(path)) {
			m_logger.warn() << "couldn't parse configuration file '" << path
				<< "' supplied on command line\n";
		}
	}
	if (auto conf = cosmos::proc::get_env_var("XIMC_CONFIG"); conf != std::nullopt) {
		const auto path = conf->str();
		if (!config.parse(path)) {
			m_logger.warn() << "couldn't parse configuration file '" << path
				<< "' supplied in XIMC_CONFIG environment variable\n";
		}
	}

	m_settings.load(config, m_logger);

	// command line settings override the configuration files
	if (m_cmdline.im_name.isSet()) {
		m_settings.im_name = m_cmdline.im_name.getValue();
	}
	if (m_cmdline.preedit.isSet()) {
		m_settings.input_style.set(InputStyleFlag::PREEDIT_CALLBACKS);
	}
	if (m_cmdline.debug.isSet()) {
		m_settings.forward_protocol_log = true;
	}
}

void Demo::connect() {
	m_conn = xcb_connect(nullptr, &m_screen_nr);

	if (xcb_connection_has_error(m_conn)) {
		xcb_disconnect(m_conn);
		m_conn = nullptr;
		throw cosmos::RuntimeError{"failed to connect to the X server"};
	}
}

void Demo::disconnect() {
	// the client refers to the connection, tear it down first
	m_client.reset();

	if (m_conn) {
		xcb_disconnect(m_conn);
		m_conn = nullptr;
	}
}

void Demo::createWindow() {
	auto it = xcb_setup_roots_iterator(xcb_get_setup(m_conn));
	for (int nr = 0; nr < m_screen_nr && it.rem; nr++) {
		xcb_screen_next(&it);
	}

	if (!it.rem) {
		throw cosmos::RuntimeError{"X screen not found"};
	}

	const auto screen = it.data;
	const uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
	const uint32_t values[] = {
		screen->white_pixel,
		XCB_EVENT_MASK_KEY_PRESS | XCB_EVENT_MASK_KEY_RELEASE |
		XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_STRUCTURE_NOTIFY |
		XCB_EVENT_MASK_FOCUS_CHANGE
	};

	m_window = xcb_generate_id(m_conn);
	xcb_create_window(m_conn, XCB_COPY_FROM_PARENT, m_window, screen->root,
			0, 0, 400, 300, 0, XCB_WINDOW_CLASS_INPUT_OUTPUT,
			screen->root_visual, mask, values);
	xcb_map_window(m_conn, m_window);
	xcb_flush(m_conn);
}

void Demo::setupClient() {
	if (m_settings.forward_protocol_log) {
		Client::setLogger([this](const std::string_view line) {
			m_logger.debug() << "xcb-imdkit: " << line << "\n";
		});
	}

	m_client = Client::create(*m_conn, m_screen_nr, m_settings, m_logger);

	m_client->setCommitStringCB([](xcb_window_t win, const std::string_view text) {
		std::cout << "[" << win << "] commit: " << text << std::endl;
	});
	m_client->setForwardEventCB([](xcb_window_t win, const KeyEvent &key) {
		std::cout << "[" << win << "] forwarded key " << (key.isPress() ? "press" : "release")
			<< ": " << static_cast<unsigned>(key.keycode()) << std::endl;
	});
	m_client->setPreeditStartCB([](xcb_window_t win) {
		std::cout << "[" << win << "] preedit start" << std::endl;
	});
	m_client->setPreeditDrawCB([](xcb_window_t win, const PreeditInfo &info) {
		std::cout << "[" << win << "] preedit draw: " << info << std::endl;
	});
	m_client->setPreeditDoneCB([](xcb_window_t win) {
		std::cout << "[" << win << "] preedit done" << std::endl;
	});

	m_client->requestPlacement(m_window, 0, 0);
}

void Demo::eventLoop() {
	while (true) {
		std::unique_ptr<xcb_generic_event_t, FreeDeleter> event{xcb_wait_for_event(m_conn)};

		if (!event) {
			m_logger.error() << "X server connection lost\n";
			break;
		}

		if (!m_client->processEvent(*event) && !handleEvent(*event))
			break;

		xcb_flush(m_conn);
	}
}

bool Demo::handleEvent(const xcb_generic_event_t &event) {
	// keycode of the Escape key on common keymaps
	constexpr xcb_keycode_t ESCAPE = 9;

	switch (event.response_type & ~0x80) {
		case XCB_KEY_PRESS: {
			const auto &key = reinterpret_cast<const xcb_key_press_event_t&>(event);
			std::cout << "unhandled key press: " << static_cast<unsigned>(key.detail) << std::endl;
			return key.detail != ESCAPE;
		}
		case XCB_BUTTON_PRESS: {
			const auto &button = reinterpret_cast<const xcb_button_press_event_t&>(event);
			const auto sent = m_client->requestPlacement(button.event, button.event_x, button.event_y);
			std::cout << "placement (" << button.event_x << ", " << button.event_y << ") "
				<< (sent ? "sent" : "deferred") << std::endl;
			break;
		}
		case XCB_CONFIGURE_NOTIFY: {
			const auto &configure = reinterpret_cast<const xcb_configure_notify_event_t&>(event);
			m_client->requestPlacement(configure.window, 0, 0);
			break;
		}
		default:
			break;
	}

	return true;
}

} // end ns

int main(int argc, const char **argv) {
	return cosmos::main<ximc::Demo>(argc, argv);
}
