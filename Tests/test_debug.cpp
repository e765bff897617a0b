#include <gtest/gtest.h>

#include <sstream>

#include "app_debug_console.hpp"
#include "app_test_helpers.hpp"

TEST(Debug, RoutesEachLevelToAttachedSink) {
	Debug_Capture capture;

	Debug::PRINT("hello");
	Debug::WARN("careful");
	Debug::ERROR("broken");

	ASSERT_EQ(capture.prints.size(), 1u);
	ASSERT_EQ(capture.warnings.size(), 1u);
	ASSERT_EQ(capture.errors.size(), 1u);
	EXPECT_EQ(capture.prints[0], "hello");
	EXPECT_EQ(capture.warnings[0], "careful");
	EXPECT_EQ(capture.errors[0], "broken");
}

TEST(Debug, DropsMessagesWithoutSink) {
	Debug::attach(nullptr);
	Debug::PRINT("nobody listening");
	Debug::ERROR("still nobody");

	//attaching afterwards doesn't replay anything
	Debug_Capture capture;
	EXPECT_TRUE(capture.prints.empty());
	EXPECT_TRUE(capture.errors.empty());
}

TEST(DebugConsole, SplitsProgressAndProblems) {
	std::ostringstream out, err;
	Debug_Console console(out, err);

	console.print("Triggering boot mode pin (state: Low).");
	console.warn("no reset pin");
	console.error("line busy");

	EXPECT_EQ(out.str(), "Triggering boot mode pin (state: Low).\n");
	EXPECT_EQ(err.str(), "WARNING: no reset pin\nERROR: line busy\n");
}

TEST(DebugConsole, QuietKeepsWarningsAndErrors) {
	std::ostringstream out, err;
	Debug_Console console(out, err);
	console.set_quiet(true);

	console.print("progress");
	console.warn("w");
	console.error("e");

	EXPECT_TRUE(out.str().empty());
	EXPECT_EQ(err.str(), "WARNING: w\nERROR: e\n");
}
