// GoogleTest
#include <gtest/gtest.h>

// cosmos
#include "cosmos/error/RuntimeError.hxx"
#include "cosmos/io/StdLogger.hxx"

// ximc
#include "ClientFixture.hxx"
#include "ContextLifecycle.hxx"
#include "FakeEngine.hxx"

namespace ximc::test {

namespace {

using LifecycleTest = ClientTest;

TEST_F(LifecycleTest, StartsWithoutContext) {
	EXPECT_FALSE(client->hasContext());
	EXPECT_TRUE(journal.requests.empty());
	EXPECT_TRUE(engine->hasListener());
}

TEST_F(LifecycleTest, PlacementRequestOpensMethod) {
	EXPECT_FALSE(client->requestPlacement(7, 10, 20));

	EXPECT_EQ(journal.names(), std::vector<std::string>{"open"});
	EXPECT_EQ(client->requestedPlacement(), (Placement{7, 10, 20}));
	EXPECT_FALSE(client->hasContext());
}

TEST_F(LifecycleTest, MethodOpenedCreatesContextFromRequest) {
	client->requestPlacement(7, 10, 20);
	engine->deliver(notify::MethodOpened{});

	const auto create = journal.last("create");
	ASSERT_NE(create, nullptr);
	ASSERT_TRUE(create->attrs.style);
	EXPECT_TRUE(create->attrs.style->none());
	EXPECT_EQ(create->attrs.client_window, xcb_window_t{7});
	EXPECT_EQ(create->attrs.focus_window, xcb_window_t{7});
	ASSERT_TRUE(create->attrs.spot);
	EXPECT_EQ(*create->attrs.spot, (Spot{10, 20}));
	// the creation request already carries the placement
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 10, 20}));
}

TEST_F(LifecycleTest, CreationUsesPreeditStyle) {
	createClient(InputStyle{InputStyleFlag::PREEDIT_CALLBACKS});
	client->requestPlacement(3, 0, 0);
	engine->deliver(notify::MethodOpened{});

	const auto create = journal.last("create");
	ASSERT_NE(create, nullptr);
	ASSERT_TRUE(create->attrs.style);
	EXPECT_TRUE((*create->attrs.style)[InputStyleFlag::PREEDIT_CALLBACKS]);
}

TEST_F(LifecycleTest, ContextCreatedFocusesContext) {
	openContext(7, 10, 20, ContextID{5});

	const auto focus = journal.last("focus");
	ASSERT_NE(focus, nullptr);
	EXPECT_EQ(focus->ctx, ContextID{5});
	EXPECT_EQ(journal.names(), (std::vector<std::string>{"open", "create", "focus"}));
}

TEST_F(LifecycleTest, NoDuplicateOpenWhileOpening) {
	client->requestPlacement(7, 10, 20);
	client->requestPlacement(7, 11, 21);
	client->processEvent(generic(makeKey(XCB_KEY_PRESS, 38)));

	EXPECT_EQ(journal.count("open"), 1u);
	EXPECT_EQ(journal.count("forward"), 0u);

	engine->deliver(notify::MethodOpened{});
	const auto create = journal.last("create");
	ASSERT_NE(create, nullptr);
	EXPECT_EQ(*create->attrs.spot, (Spot{11, 21}));
}

TEST_F(LifecycleTest, FailedOpenIsRetriedOnNextUse) {
	engine->open_result = false;
	client->requestPlacement(7, 10, 20);
	EXPECT_EQ(journal.count("open"), 1u);

	engine->open_result = true;
	client->requestPlacement(7, 10, 20);
	EXPECT_EQ(journal.count("open"), 2u);
}

TEST_F(LifecycleTest, FailedCreateRequestIsRetriedOnNextUse) {
	engine->create_result = false;
	client->requestPlacement(7, 10, 20);
	engine->deliver(notify::MethodOpened{});
	EXPECT_FALSE(client->hasContext());

	engine->create_result = true;
	client->requestPlacement(7, 10, 20);
	EXPECT_EQ(journal.count("open"), 2u);
	engine->deliver(notify::MethodOpened{});
	engine->deliver(notify::ContextCreated{ContextID{2}});
	EXPECT_TRUE(client->hasContext());
}

TEST_F(LifecycleTest, RejectedCreationIsRetriedOnNextUse) {
	client->requestPlacement(7, 10, 20);
	engine->deliver(notify::MethodOpened{});
	engine->deliver(notify::ContextCreated{ContextID::INVALID});

	EXPECT_FALSE(client->hasContext());
	EXPECT_EQ(journal.count("focus"), 0u);

	client->processEvent(generic(makeKey(XCB_KEY_PRESS, 38)));
	EXPECT_EQ(journal.count("open"), 2u);
}

TEST_F(LifecycleTest, UnsolicitedMethodOpenedIsIgnored) {
	engine->deliver(notify::MethodOpened{});
	EXPECT_EQ(journal.count("create"), 0u);
}

TEST_F(LifecycleTest, DisconnectDropsContext) {
	openContext(7, 10, 20, ContextID{5});
	engine->deliver(notify::Disconnected{});

	EXPECT_FALSE(client->hasContext());

	// key events are no longer forwarded, a reconnect is requested instead
	EXPECT_FALSE(client->processEvent(generic(makeKey(XCB_KEY_PRESS, 38))));
	EXPECT_EQ(journal.count("forward"), 0u);
	EXPECT_EQ(journal.count("open"), 2u);
}

TEST_F(LifecycleTest, ReopenedContextIsUsed) {
	openContext(7, 10, 20, ContextID{5});
	engine->deliver(notify::Disconnected{});
	openContext(7, 10, 20, ContextID{6});

	client->processEvent(generic(makeKey(XCB_KEY_PRESS, 38)));
	const auto forward = journal.last("forward");
	ASSERT_NE(forward, nullptr);
	EXPECT_EQ(forward->ctx, ContextID{6});
}

TEST_F(LifecycleTest, LateCreationAfterDisconnectIsIgnored) {
	client->requestPlacement(7, 10, 20);
	engine->deliver(notify::MethodOpened{});
	engine->deliver(notify::Disconnected{});
	engine->deliver(notify::ContextCreated{ContextID{5}});

	EXPECT_FALSE(client->hasContext());
	EXPECT_EQ(journal.count("focus"), 0u);

	// the next use starts over
	EXPECT_FALSE(client->requestPlacement(7, 10, 20));
	EXPECT_EQ(journal.count("open"), 2u);
}

TEST_F(LifecycleTest, DuplicateCreationKeepsPendingUpdates) {
	openContext(7, 10, 20, ContextID{5});
	EXPECT_TRUE(client->requestPlacement(7, 11, 21));
	EXPECT_FALSE(client->requestPlacement(7, 12, 22));

	engine->deliver(notify::ContextCreated{ContextID{6}});
	EXPECT_EQ(journal.count("focus"), 1u);

	// the deferred update is still sent to the original context
	engine->deliver(notify::ContextValuesSet{ContextID{5}});
	const auto values = journal.last("values");
	ASSERT_NE(values, nullptr);
	EXPECT_EQ(values->ctx, ContextID{5});
	EXPECT_EQ(*values->attrs.spot, (Spot{12, 22}));
}

TEST_F(LifecycleTest, CreateWithoutEngineThrows) {
	EXPECT_THROW(Client::create(std::unique_ptr<ProtocolEngine>{}, InputStyle{}, logger),
			cosmos::RuntimeError);
}

/// Operates a ContextLifecycle without a Client on top.
class ContextStateTest :
		public testing::Test {
protected: // data

	EngineJournal journal;
	cosmos::StdLogger logger;
	FakeEngine engine{journal};
	ContextLifecycle lifecycle{engine, InputStyle{}, logger};
	const Placement placement{7, 10, 20};
};

TEST_F(ContextStateTest, Transitions) {
	using State = ContextLifecycle::State;
	EXPECT_EQ(lifecycle.state(), State::NO_CONTEXT);

	lifecycle.ensureOpen();
	EXPECT_EQ(lifecycle.state(), State::OPENING);
	EXPECT_FALSE(lifecycle.context());

	EXPECT_TRUE(lifecycle.methodOpened(placement));
	EXPECT_EQ(lifecycle.state(), State::OPENING);

	EXPECT_TRUE(lifecycle.contextCreated(ContextID{5}));
	EXPECT_EQ(lifecycle.state(), State::OPEN);
	EXPECT_EQ(lifecycle.context(), ContextID{5});

	// a second reply does not replace the context
	EXPECT_FALSE(lifecycle.contextCreated(ContextID{6}));
	EXPECT_EQ(lifecycle.context(), ContextID{5});

	lifecycle.disconnected();
	EXPECT_EQ(lifecycle.state(), State::NO_CONTEXT);
	EXPECT_FALSE(lifecycle.context());
}

TEST_F(ContextStateTest, LateCreationReplyIsIgnored) {
	lifecycle.ensureOpen();
	lifecycle.methodOpened(placement);
	lifecycle.disconnected();

	EXPECT_FALSE(lifecycle.contextCreated(ContextID{5}));
	EXPECT_EQ(lifecycle.state(), ContextLifecycle::State::NO_CONTEXT);
	EXPECT_EQ(journal.count("focus"), 0u);
}

TEST_F(ContextStateTest, FailedOpenReturnsToNoContext) {
	engine.open_result = false;
	lifecycle.ensureOpen();
	EXPECT_EQ(lifecycle.state(), ContextLifecycle::State::NO_CONTEXT);

	engine.open_result = true;
	lifecycle.ensureOpen();
	lifecycle.ensureOpen();
	EXPECT_EQ(lifecycle.state(), ContextLifecycle::State::OPENING);
	EXPECT_EQ(journal.count("open"), 2u);
}

TEST_F(ContextStateTest, DestroyOnlyAffectsOpenContexts) {
	lifecycle.destroy();
	EXPECT_EQ(journal.count("destroy"), 0u);

	lifecycle.ensureOpen();
	lifecycle.methodOpened(placement);
	lifecycle.contextCreated(ContextID{5});
	engine.destroy_result = false;
	lifecycle.destroy();

	EXPECT_EQ(journal.count("destroy"), 1u);
	EXPECT_EQ(lifecycle.state(), ContextLifecycle::State::NO_CONTEXT);
}

} // end anon ns

} // end ns
