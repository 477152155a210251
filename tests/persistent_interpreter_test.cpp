#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "execution/persistent_interpreter.hpp"
#include "test_helpers.hpp"

namespace execbox::execution {
namespace {

using namespace std::chrono_literals;

class PersistentInterpreterTest : public ::testing::Test {
protected:
    void SetUp() override {
        EXECBOX_REQUIRE_EXECUTABLE("python3");
        interpreter_ = std::make_unique<PersistentInterpreter>(registry_, "python3", "", process::Environment{});
    }

    void TearDown() override {
        interpreter_.reset();
    }

    process::ProcessRegistry registry_;
    std::unique_ptr<PersistentInterpreter> interpreter_;
};

TEST_F(PersistentInterpreterTest, ReusesOneProcessAcrossCalls) {
    EXPECT_FALSE(interpreter_->process_id().has_value());
    interpreter_->Start();
    const auto first_id = interpreter_->process_id();
    ASSERT_TRUE(first_id.has_value());

    ASSERT_TRUE(interpreter_->Execute("a = 1\n", 30s).success);
    const auto result = interpreter_->Execute("_result = a + 1\n", 30s);
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.result.AsInteger(), 2);
    EXPECT_EQ(interpreter_->process_id(), first_id);
    EXPECT_EQ(registry_.ListProcesses().size(), 1u);
}

TEST_F(PersistentInterpreterTest, ExceptionsKeepTheInterpreterAlive) {
    ASSERT_TRUE(interpreter_->Execute("kept = 'yes'\n", 30s).success);
    const auto failure = interpreter_->Execute("raise RuntimeError('boom')\n", 30s);
    EXPECT_FALSE(failure.success);
    EXPECT_EQ(failure.error_type, "RuntimeError");
    EXPECT_EQ(failure.error, "boom");
    EXPECT_NE(failure.stderr_text.find("RuntimeError: boom"), std::string::npos);

    const auto after = interpreter_->Execute("_result = kept\n", 30s);
    ASSERT_TRUE(after.success);
    EXPECT_EQ(after.result.AsString(), "yes");
}

TEST_F(PersistentInterpreterTest, TimeoutDiscardsInterpreter) {
    interpreter_->Start();
    const auto previous = interpreter_->process_id();

    const auto result = interpreter_->Execute("import time\ntime.sleep(30)\n", 500ms);
    EXPECT_EQ(result.error_type, protocol::kTimeoutError);
    EXPECT_FALSE(interpreter_->process_id().has_value());
    EXPECT_TRUE(registry_.ListProcesses().empty());

    ASSERT_TRUE(interpreter_->Execute("_result = 1\n", 30s).success);
    EXPECT_NE(interpreter_->process_id(), previous);
}

TEST_F(PersistentInterpreterTest, RestartsAfterInterpreterExits) {
    const auto exited = interpreter_->Execute("import os\nos._exit(3)\n", 30s);
    EXPECT_FALSE(exited.success);
    EXPECT_EQ(exited.exit_code, 3);

    const auto result = interpreter_->Execute("_result = 'back'\n", 30s);
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.result.AsString(), "back");
}

TEST_F(PersistentInterpreterTest, AbandonedStreamDiscardsInterpreter) {
    ASSERT_TRUE(interpreter_->Execute("state = 1\n", 30s).success);
    {
        auto stream = interpreter_->ExecuteStream("import time\nprint('working', flush=True)\ntime.sleep(30)\n", 30s);
        EXPECT_EQ(stream.Next(), "working");
    }
    EXPECT_FALSE(interpreter_->process_id().has_value());

    const auto result = interpreter_->Execute("_result = 'state' in globals()\n", 30s);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.result.AsBool());
}

TEST_F(PersistentInterpreterTest, FinishedStreamKeepsInterpreter) {
    interpreter_->Start();
    const auto previous = interpreter_->process_id();
    auto lines = interpreter_->ExecuteStream("import sys\nprint('out')\nprint('err', file=sys.stderr)\n", 30s).Collect();
    std::sort(lines.begin(), lines.end());
    EXPECT_EQ(lines, (std::vector<std::string>{"err", "out"}));
    EXPECT_EQ(interpreter_->process_id(), previous);
}

TEST_F(PersistentInterpreterTest, OutputBuffersHoldOnlyTheLatestReply) {
    for (int i = 0; i < 50; ++i) {
        const auto result = interpreter_->Execute("print('x' * 10000)\n_result = " + std::to_string(i) + "\n", 30s);
        ASSERT_TRUE(result.success) << result.stderr_text;
        EXPECT_EQ(result.stdout_text, std::string(10000, 'x') + "\n");
    }
    const auto streamed = interpreter_->ExecuteStream("print('y' * 10000)\n", 30s).Collect();
    EXPECT_EQ(streamed, (std::vector<std::string>{std::string(10000, 'y')}));
    ASSERT_TRUE(interpreter_->Execute("_result = 1\n", 30s).success);

    const auto process_id = interpreter_->process_id();
    ASSERT_TRUE(process_id.has_value());
    const auto buffered = registry_.GetOutput(*process_id);
    EXPECT_TRUE(buffered.stdout_text.empty());
    EXPECT_TRUE(buffered.stderr_text.empty());
    EXPECT_TRUE(buffered.combined.empty());
}

TEST_F(PersistentInterpreterTest, StopReleasesTheProcess) {
    interpreter_->Start();
    EXPECT_EQ(registry_.ListProcesses().size(), 1u);
    interpreter_->Stop();
    EXPECT_FALSE(interpreter_->process_id().has_value());
    EXPECT_TRUE(registry_.ListProcesses().empty());
}

}  // namespace
}  // namespace execbox::execution
