#include <gtest/gtest.h>

#include <sstream>

#include "cli/CommandRegistry.hpp"
#include "cli/commands/TestsCommand.hpp"
#include "util/Logger.hpp"
#include "test_utils.hpp"

using namespace improver;
using namespace improver::test::utils;

class TestsCommandTest : public ::testing::Test {
protected:
    void SetUp() override { savedLevel = Logger::instance().level(); }
    void TearDown() override { Logger::instance().setLevel(savedLevel); }

    CommandRegistry registry;
    std::ostringstream out;
    std::ostringstream err;
    AppContext ctx{out, err, registry};
    LogLevel savedLevel{LogLevel::Info};
};

TEST_F(TestsCommandTest, SpecDescribesDocumentedSurface) {
    auto spec = TestsCommand::helpSpec();
    EXPECT_EQ(spec.name, "tests");
    EXPECT_EQ(spec.usage, "improver tests [--debug]");
    EXPECT_EQ(spec.description, "Run pep8, pylint, unit and CLI acceptance tests.");
    ASSERT_EQ(spec.options.size(), 1u);
    EXPECT_EQ(spec.options[0].flagToken(), "--debug");
    EXPECT_EQ(spec.options[0].description, "Run in verbose mode (may take longer for CLI)");
    EXPECT_TRUE(validateSpec(spec).has_value());
}

// Suite execution belongs to the external runner
TEST_F(TestsCommandTest, ExecutionReportsExternalRunner) {
    TestsCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotSupported);
    EXPECT_EQ(out.str(), "");
}

TEST_F(TestsCommandTest, DebugFlagRaisesLogLevel) {
    Logger::instance().setLevel(LogLevel::Info);
    TestsCommand cmd;
    auto result = cmd.execute(ctx, {"--debug"});
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
}
