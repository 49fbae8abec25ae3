#pragma once

// C++
#include <memory>

// GoogleTest
#include <gtest/gtest.h>

// cosmos
#include "cosmos/io/StdLogger.hxx"

// ximc
#include "Client.hxx"
#include "FakeEngine.hxx"

namespace ximc::test {

/// Base fixture operating a Client on top of a FakeEngine.
class ClientTest :
		public testing::Test {
protected: // functions

	void SetUp() override {
		createClient(InputStyle{});
	}

	void createClient(const InputStyle style) {
		client.reset();
		journal.requests.clear();
		auto fake = std::make_unique<FakeEngine>(journal);
		engine = fake.get();
		client = Client::create(std::move(fake), style, logger);
	}

	/// Drives the client through the complete open sequence.
	void openContext(const xcb_window_t win, const int16_t x, const int16_t y, const ContextID ctx) {
		EXPECT_FALSE(client->requestPlacement(win, x, y));
		engine->deliver(notify::MethodOpened{});
		engine->deliver(notify::ContextCreated{ctx});
		ASSERT_TRUE(client->hasContext());
	}

	static xcb_key_press_event_t makeKey(const uint8_t type, const xcb_keycode_t code,
			const xcb_window_t win = 7) {
		xcb_key_press_event_t ev{};
		ev.response_type = type;
		ev.detail = code;
		ev.event = win;
		ev.time = 1000;
		ev.state = XCB_MOD_MASK_SHIFT;
		return ev;
	}

	static const xcb_generic_event_t& generic(const xcb_key_press_event_t &ev) {
		return reinterpret_cast<const xcb_generic_event_t&>(ev);
	}

protected: // data

	// declared before the client, so it remains available during teardown
	EngineJournal journal;
	cosmos::StdLogger logger;
	FakeEngine *engine = nullptr;
	std::unique_ptr<Client> client;
};

} // end ns
