// GoogleTest
#include <gtest/gtest.h>

// cosmos
#include "cosmos/io/StdLogger.hxx"

// ximc
#include "ClientFixture.hxx"
#include "ContextLifecycle.hxx"
#include "FakeEngine.hxx"
#include "PlacementCoordinator.hxx"

namespace ximc::test {

namespace {

class PlacementTest :
		public ClientTest {
protected: // functions

	void SetUp() override {
		ClientTest::SetUp();
		openContext(7, 1, 1, CTX);
	}

	static constexpr ContextID CTX{3};
};

TEST_F(PlacementTest, RapidUpdatesAreCoalesced) {
	EXPECT_TRUE(client->requestPlacement(7, 10, 20));

	auto values = journal.last("values");
	ASSERT_NE(values, nullptr);
	EXPECT_EQ(values->ctx, CTX);
	EXPECT_EQ(*values->attrs.spot, (Spot{10, 20}));
	// the window is unchanged, only the spot is sent
	EXPECT_FALSE(values->attrs.client_window);
	EXPECT_FALSE(values->attrs.focus_window);

	EXPECT_FALSE(client->requestPlacement(7, 15, 25));
	EXPECT_EQ(journal.count("values"), 1u);
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 10, 20}));

	// completion of the first update sends the deferred one
	engine->deliver(notify::ContextValuesSet{CTX});
	EXPECT_EQ(journal.count("values"), 2u);
	values = journal.last("values");
	EXPECT_EQ(*values->attrs.spot, (Spot{15, 25}));
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 15, 25}));

	engine->deliver(notify::ContextValuesSet{CTX});
	EXPECT_EQ(journal.count("values"), 2u);

	// nothing in flight anymore
	EXPECT_TRUE(client->requestPlacement(7, 16, 26));
	EXPECT_EQ(journal.count("values"), 3u);
}

TEST_F(PlacementTest, LatestDeferredRequestWins) {
	EXPECT_TRUE(client->requestPlacement(7, 10, 20));
	EXPECT_FALSE(client->requestPlacement(7, 11, 21));
	EXPECT_FALSE(client->requestPlacement(7, 12, 22));
	EXPECT_FALSE(client->requestPlacement(7, 13, 23));

	engine->deliver(notify::ContextValuesSet{CTX});
	engine->deliver(notify::ContextValuesSet{CTX});

	EXPECT_EQ(journal.count("values"), 2u);
	EXPECT_EQ(*journal.last("values")->attrs.spot, (Spot{13, 23}));
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 13, 23}));
}

TEST_F(PlacementTest, WindowChangeRebindsContext) {
	EXPECT_TRUE(client->requestPlacement(9, 4, 5));

	const auto values = journal.last("values");
	ASSERT_NE(values, nullptr);
	EXPECT_EQ(values->attrs.client_window, xcb_window_t{9});
	EXPECT_EQ(values->attrs.focus_window, xcb_window_t{9});
	EXPECT_EQ(*values->attrs.spot, (Spot{4, 5}));
	EXPECT_EQ(client->currentPlacement(), (Placement{9, 4, 5}));

	engine->deliver(notify::ContextValuesSet{CTX});
	EXPECT_TRUE(client->requestPlacement(9, 6, 7));
	EXPECT_FALSE(journal.last("values")->attrs.client_window);
}

TEST_F(PlacementTest, WindowChangeWhileInFlight) {
	EXPECT_TRUE(client->requestPlacement(7, 10, 20));
	EXPECT_FALSE(client->requestPlacement(9, 4, 5));

	engine->deliver(notify::ContextValuesSet{CTX});
	ASSERT_EQ(journal.count("values"), 2u);
	auto values = journal.last("values");
	// the deferred update moves the context to the new window
	EXPECT_EQ(values->attrs.client_window, xcb_window_t{9});
	EXPECT_EQ(values->attrs.focus_window, xcb_window_t{9});
	EXPECT_EQ(*values->attrs.spot, (Spot{4, 5}));
	EXPECT_EQ(client->currentPlacement(), (Placement{9, 4, 5}));

	engine->deliver(notify::ContextValuesSet{CTX});
	EXPECT_TRUE(client->requestPlacement(9, 6, 7));
	values = journal.last("values");
	EXPECT_FALSE(values->attrs.client_window);
	EXPECT_FALSE(values->attrs.focus_window);
	EXPECT_EQ(*values->attrs.spot, (Spot{6, 7}));
}

TEST_F(PlacementTest, StaleAcknowledgementIsIgnored) {
	EXPECT_TRUE(client->requestPlacement(7, 10, 20));
	engine->deliver(notify::ContextValuesSet{ContextID{99}});

	EXPECT_FALSE(client->requestPlacement(7, 11, 21));
	EXPECT_EQ(journal.count("values"), 1u);
}

TEST_F(PlacementTest, FailedSendIsNotInFlight) {
	engine->values_result = false;
	EXPECT_FALSE(client->requestPlacement(7, 10, 20));
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 1, 1}));
	EXPECT_EQ(client->requestedPlacement(), (Placement{7, 10, 20}));

	engine->values_result = true;
	EXPECT_TRUE(client->requestPlacement(7, 10, 20));
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 10, 20}));
}

TEST_F(PlacementTest, ImmediateCompletion) {
	engine->complete_values_immediately = true;

	EXPECT_TRUE(client->requestPlacement(7, 10, 20));
	EXPECT_TRUE(client->requestPlacement(7, 11, 21));
	EXPECT_EQ(journal.count("values"), 2u);
	EXPECT_EQ(client->currentPlacement(), (Placement{7, 11, 21}));
}

TEST_F(PlacementTest, NewContextStartsWithoutOutstandingUpdates) {
	EXPECT_TRUE(client->requestPlacement(7, 10, 20));
	EXPECT_FALSE(client->requestPlacement(7, 11, 21));

	engine->deliver(notify::Disconnected{});
	EXPECT_FALSE(client->requestPlacement(8, 12, 22));
	engine->deliver(notify::MethodOpened{});

	// the new context is created with the latest request
	const auto create = journal.last("create");
	ASSERT_NE(create, nullptr);
	EXPECT_EQ(create->attrs.client_window, xcb_window_t{8});
	EXPECT_EQ(*create->attrs.spot, (Spot{12, 22}));

	engine->deliver(notify::ContextCreated{ContextID{4}});
	const auto num_values = journal.count("values");

	EXPECT_TRUE(client->requestPlacement(8, 13, 23));
	EXPECT_EQ(journal.count("values"), num_values + 1);
	EXPECT_EQ(journal.last("values")->ctx, ContextID{4});
	EXPECT_FALSE(journal.last("values")->attrs.client_window);
}

/// Operates a PlacementCoordinator on an open context without a Client.
class CoordinatorTest :
		public testing::Test {
protected: // functions

	void SetUp() override {
		lifecycle.ensureOpen();
		lifecycle.methodOpened(Placement{7, 0, 0});
		lifecycle.contextCreated(CTX);
		coordinator.contextOpened();
	}

	static constexpr ContextID CTX{3};

protected: // data

	EngineJournal journal;
	cosmos::StdLogger logger;
	FakeEngine engine{journal};
	ContextLifecycle lifecycle{engine, InputStyle{}, logger};
	PlacementCoordinator coordinator{engine, lifecycle, logger};
};

TEST_F(CoordinatorTest, InFlightTracking) {
	EXPECT_FALSE(coordinator.inFlight());
	EXPECT_FALSE(coordinator.updatePending());

	EXPECT_TRUE(coordinator.request(Placement{7, 1, 1}));
	EXPECT_TRUE(coordinator.inFlight());
	EXPECT_FALSE(coordinator.updatePending());

	EXPECT_FALSE(coordinator.request(Placement{7, 2, 2}));
	EXPECT_TRUE(coordinator.inFlight());
	EXPECT_TRUE(coordinator.updatePending());

	// the pending update is sent and is in flight now
	coordinator.updateDone(CTX);
	EXPECT_TRUE(coordinator.inFlight());
	EXPECT_FALSE(coordinator.updatePending());

	coordinator.updateDone(CTX);
	EXPECT_FALSE(coordinator.inFlight());
	EXPECT_EQ(journal.count("values"), 2u);
}

TEST_F(CoordinatorTest, StaleAcknowledgementKeepsState) {
	coordinator.request(Placement{7, 1, 1});
	coordinator.request(Placement{7, 2, 2});

	coordinator.updateDone(ContextID{42});
	EXPECT_TRUE(coordinator.inFlight());
	EXPECT_TRUE(coordinator.updatePending());
	EXPECT_EQ(journal.count("values"), 1u);
}

TEST_F(CoordinatorTest, RejectedSendIsNotInFlight) {
	engine.values_result = false;
	EXPECT_FALSE(coordinator.request(Placement{7, 1, 1}));
	EXPECT_FALSE(coordinator.inFlight());
	EXPECT_EQ(coordinator.requested(), (Placement{7, 1, 1}));
	EXPECT_EQ(coordinator.current(), Placement{});
}

TEST_F(CoordinatorTest, NewContextClearsOutstandingUpdates) {
	coordinator.request(Placement{7, 1, 1});
	coordinator.request(Placement{7, 2, 2});

	coordinator.contextOpened();
	EXPECT_FALSE(coordinator.inFlight());
	EXPECT_FALSE(coordinator.updatePending());
	EXPECT_TRUE(coordinator.request(Placement{7, 3, 3}));
}

} // end anon ns

} // end ns
