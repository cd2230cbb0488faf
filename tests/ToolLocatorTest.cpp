#include "ToolLocator.hpp"
#include "fakes/FakeProcessRunner.hpp"
#include "fakes/TestSandbox.hpp"
#include <gtest/gtest.h>

TEST(tool_locator, first_existing_candidate_wins) {
    TestSandbox sandbox;
    FakeProcessRunner runner;
    std::string manual = sandbox.writeFile("usr-local/adb", "");
    std::string sdk = sandbox.writeFile("sdk/platform-tools/adb", "");

    ToolLocator locator(runner, {{"adb", {sandbox.root() + "/homebrew/adb", manual, sdk}}});

    auto path = locator.locate(Tool::ADB);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, manual);
    EXPECT_TRUE(runner.calls().empty());
}

TEST(tool_locator, falls_back_to_which_when_result_exists) {
    TestSandbox sandbox;
    FakeProcessRunner runner;
    auto overrides = sandbox.tools({Tool::WHICH});
    std::string onPath = sandbox.writeFile("path/adb", "");
    runner.respond(sandbox.toolPath(Tool::WHICH) + " adb", onPath + "\n");

    ToolLocator locator(runner, overrides);

    auto path = locator.locate(Tool::ADB);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, onPath);
}

TEST(tool_locator, rejects_which_answer_that_does_not_exist) {
    TestSandbox sandbox;
    FakeProcessRunner runner;
    auto overrides = sandbox.tools({Tool::WHICH});
    runner.respond(sandbox.toolPath(Tool::WHICH) + " emulator", sandbox.root() + "/gone/emulator\n");

    ToolLocator locator(runner, overrides);

    EXPECT_FALSE(locator.locate(Tool::EMULATOR).has_value());
}

TEST(tool_locator, not_found_when_nothing_matches) {
    TestSandbox sandbox;
    FakeProcessRunner runner;
    ToolLocator locator(runner, sandbox.tools({}));

    EXPECT_FALSE(locator.locate(Tool::XCRUN).has_value());
    EXPECT_FALSE(locator.locate(Tool::ADB).has_value());
}

TEST(tool_locator, tool_dropped_from_sandbox_is_no_longer_found) {
    TestSandbox sandbox;
    FakeProcessRunner runner;
    ToolLocator before(runner, sandbox.tools({Tool::XCRUN, Tool::ADB}));
    ASSERT_TRUE(before.locate(Tool::XCRUN).has_value());

    ToolLocator after(runner, sandbox.tools({Tool::ADB}));
    EXPECT_FALSE(after.locate(Tool::XCRUN).has_value());
    EXPECT_TRUE(after.locate(Tool::ADB).has_value());
}

TEST(tool_locator, default_adb_candidates_prefer_package_manager) {
    auto candidates = ToolLocator::defaultCandidates(Tool::ADB);
    ASSERT_GE(candidates.size(), 4u);
    EXPECT_EQ(candidates[0], "/opt/homebrew/bin/adb");
    EXPECT_EQ(candidates[1], "/usr/local/bin/adb");
    EXPECT_EQ(candidates[2], "/usr/bin/adb");
}

TEST(tool_locator, overrides_replace_defaults) {
    FakeProcessRunner runner;
    ToolLocator locator(runner, {{"xcrun", {"/custom/xcrun"}}});
    auto candidates = locator.candidates(Tool::XCRUN);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0], "/custom/xcrun");
    EXPECT_EQ(locator.candidates(Tool::OPEN), ToolLocator::defaultCandidates(Tool::OPEN));
}
