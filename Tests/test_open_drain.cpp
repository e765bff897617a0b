#include <gtest/gtest.h>

#include "app_hal_open_drain.hpp"
#include "app_test_helpers.hpp"

using Mode = GPIO_Interface::Mode;
using Level = GPIO_Interface::Level;
using Pull = GPIO_Interface::Pull;

TEST(OpenDrainPin, InitClaimsAndReleases) {
	std::vector<Line_Event> log;
	Fake_GPIO line("boot", log);
	Open_Drain_Pin pin(line);

	ASSERT_EQ(pin.init(), GPIO_Interface::GPIO_STATUS::GPIO_OK);
	EXPECT_TRUE(pin.is_claimed());
	EXPECT_EQ(pin.get(), Open_Drain_Pin::Drive::OPEN);

	ASSERT_EQ(log.size(), 2u);
	EXPECT_EQ(log[0].kind, Line_Event::Kind::INIT);
	EXPECT_TRUE(is_released(log[1]));
}

TEST(OpenDrainPin, LowDrivesOutputAndOpenFloatsWithPullUp) {
	std::vector<Line_Event> log;
	Fake_GPIO line("boot", log);
	Open_Drain_Pin pin(line);
	ASSERT_EQ(pin.init(), GPIO_Interface::GPIO_STATUS::GPIO_OK);

	ASSERT_EQ(pin.set_low(), GPIO_Interface::GPIO_STATUS::GPIO_OK);
	EXPECT_EQ(pin.get(), Open_Drain_Pin::Drive::LOW);
	EXPECT_EQ(line.read(), Level::LOW);
	EXPECT_TRUE(is_driven_low(log.back()));

	ASSERT_EQ(pin.set(Open_Drain_Pin::Drive::OPEN), GPIO_Interface::GPIO_STATUS::GPIO_OK);
	EXPECT_EQ(pin.get(), Open_Drain_Pin::Drive::OPEN);
	EXPECT_EQ(line.read(), Level::HIGH);
	EXPECT_TRUE(is_released(log.back()));
}

TEST(OpenDrainPin, DropStateFallsBackToInitialState) {
	std::vector<Line_Event> log;
	Fake_GPIO line("reset", log, {Mode::OUTPUT, Level::HIGH, Pull::PULL_DOWN});

	//only override the pull; mode and level come from before the claim
	Open_Drain_Pin::Drop_State drop;
	drop.pull = Pull::PULL_UP;
	Open_Drain_Pin pin(line, drop);

	auto target = pin.drop_target();
	EXPECT_EQ(target.mode, Mode::OUTPUT);
	EXPECT_EQ(target.level, Level::HIGH);
	EXPECT_EQ(target.pull, Pull::PULL_UP);

	ASSERT_EQ(pin.init(), GPIO_Interface::GPIO_STATUS::GPIO_OK);
	ASSERT_EQ(pin.set_low(), GPIO_Interface::GPIO_STATUS::GPIO_OK);
	pin.deinit();

	ASSERT_GE(log.size(), 2u);
	const auto& restore = log[log.size() - 2];
	EXPECT_EQ(restore.kind, Line_Event::Kind::CONFIGURE);
	EXPECT_EQ(restore.state.mode, Mode::OUTPUT);
	EXPECT_EQ(restore.state.level, Level::HIGH);
	EXPECT_EQ(restore.state.pull, Pull::PULL_UP);
	EXPECT_EQ(log.back().kind, Line_Event::Kind::DEINIT);
	EXPECT_FALSE(line.claimed);
}

TEST(OpenDrainPin, DeinitIsIdempotent) {
	std::vector<Line_Event> log;
	Fake_GPIO line("boot", log);
	{
		Open_Drain_Pin pin(line);
		ASSERT_EQ(pin.init(), GPIO_Interface::GPIO_STATUS::GPIO_OK);
		pin.deinit();
		pin.deinit();
		//destructor runs deinit a third time
	}

	size_t releases = 0;
	for(const auto& event : log) if(event.kind == Line_Event::Kind::DEINIT) releases++;
	EXPECT_EQ(releases, 1u);
}

TEST(OpenDrainPin, FailedClaimLeavesPinUnclaimed) {
	std::vector<Line_Event> log;
	Fake_GPIO line("boot", log);
	line.fail_init = true;
	Open_Drain_Pin pin(line);

	EXPECT_EQ(pin.init(), GPIO_Interface::GPIO_STATUS::GPIO_UNAVAILABLE);
	EXPECT_FALSE(pin.is_claimed());
	EXPECT_EQ(pin.set_low(), GPIO_Interface::GPIO_STATUS::GPIO_ERROR);

	//nothing beyond the attempt reached the line
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].kind, Line_Event::Kind::INIT);
}

TEST(OpenDrainPin, ClaimReleasesOnScopeExit) {
	std::vector<Line_Event> log;
	Fake_GPIO line("boot", log);
	Open_Drain_Pin pin(line);

	{
		Open_Drain_Pin::Claim claim(pin);
		ASSERT_TRUE(claim.ok());
		ASSERT_EQ(pin.set_low(), GPIO_Interface::GPIO_STATUS::GPIO_OK);
		EXPECT_TRUE(line.claimed);
	}

	EXPECT_FALSE(pin.is_claimed());
	EXPECT_FALSE(line.claimed);
	EXPECT_EQ(log.back().kind, Line_Event::Kind::DEINIT);
}

TEST(OpenDrainPin, FailedClaimGuardReleasesNothing) {
	std::vector<Line_Event> log;
	Fake_GPIO line("boot", log);
	line.fail_init = true;
	Open_Drain_Pin pin(line);

	{
		Open_Drain_Pin::Claim claim(pin);
		EXPECT_FALSE(claim.ok());
		EXPECT_EQ(claim.status(), GPIO_Interface::GPIO_STATUS::GPIO_UNAVAILABLE);
	}

	for(const auto& event : log) EXPECT_NE(event.kind, Line_Event::Kind::DEINIT);
}
