#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "execution/local_environment.hpp"
#include "test_helpers.hpp"

namespace execbox::execution {
namespace {

using namespace std::chrono_literals;

config::ExecutionConfig PythonConfig(double timeout_s = 30.0, bool isolated = true) {
    config::ExecutionConfig config{};
    config.language = "python";
    config.timeout_s = timeout_s;
    config.isolated = isolated;
    return config;
}

class LocalEnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        EXECBOX_REQUIRE_EXECUTABLE("python3");
    }
};

TEST_F(LocalEnvironmentTest, ReturnsValueOfMain) {
    LocalEnvironment environment(PythonConfig());
    EnvironmentSession session(environment);

    const auto result = session->Execute("def main():\n    return {'answer': 42, 'items': [1, 2]}\n");
    ASSERT_TRUE(result.success) << result.error.value_or("") << result.stderr_text;
    EXPECT_EQ(result.result.Find("answer")->AsInteger(), 42);
    EXPECT_EQ(result.result.Find("items")->AsSequence().size(), 2u);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GE(result.duration, 0.0);
}

TEST_F(LocalEnvironmentTest, AwaitsAsyncMain) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute(
        "import asyncio\n"
        "async def main():\n"
        "    await asyncio.sleep(0)\n"
        "    return 'awaited'\n");
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.result.AsString(), "awaited");
}

TEST_F(LocalEnvironmentTest, FallsBackToResultVariable) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute("print('hello')\n_result = 21 * 2\n");
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.result.AsInteger(), 42);
    EXPECT_EQ(result.stdout_text, "hello\n");
}

TEST_F(LocalEnvironmentTest, NoResultIsNullSuccess) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute("x = 1\n");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.result.is_null());
    EXPECT_EQ(result.stdout_text, "");
}

TEST_F(LocalEnvironmentTest, UnserializableResultIsOpaque) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute("class Thing:\n    def __repr__(self):\n        return 'Thing()'\n_result = Thing()\n");
    ASSERT_TRUE(result.success) << result.stderr_text;
    ASSERT_EQ(result.result.kind(), protocol::Value::Kind::kOpaque);
    EXPECT_EQ(result.result.AsOpaque().repr, "Thing()");
}

TEST_F(LocalEnvironmentTest, ExceptionIsReportedWithItsClass) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute("raise ValueError('bad input')\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "ValueError");
    EXPECT_EQ(result.error, "bad input");
    EXPECT_TRUE(result.result.is_null());
    EXPECT_NE(result.stderr_text.find("Traceback"), std::string::npos);
}

TEST_F(LocalEnvironmentTest, SyntaxErrorIsClassified) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute("def broken(:\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "SyntaxError");
}

TEST_F(LocalEnvironmentTest, TimeoutKillsTheProgram) {
    LocalEnvironment environment(PythonConfig(0.5));
    const auto started = std::chrono::steady_clock::now();
    const auto result = environment.Execute("import time\nprint('started', flush=True)\ntime.sleep(30)\n");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, protocol::kTimeoutError);
    EXPECT_NE(result.error->find("timed out"), std::string::npos);
    EXPECT_TRUE(environment.registry().ListProcesses().empty());
}

TEST_F(LocalEnvironmentTest, ReleasesProcessesAfterEachCall) {
    LocalEnvironment environment(PythonConfig());
    environment.Execute("_result = 1\n");
    environment.ExecuteCommand("echo hi");
    EXPECT_TRUE(environment.registry().ListProcesses().empty());
}

TEST_F(LocalEnvironmentTest, StreamsLinesAndAppendsResult) {
    LocalEnvironment environment(PythonConfig());
    auto stream = environment.ExecuteStream("print('one')\nprint('two')\n_result = 3\n");
    const auto lines = stream.Collect();
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "Result: 3"}));
}

TEST_F(LocalEnvironmentTest, StreamEndsWithErrorLineOnFailure) {
    LocalEnvironment environment(PythonConfig());
    const auto lines = environment.ExecuteStream("print('before')\nraise KeyError('k')\n").Collect();
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "before");
    EXPECT_EQ(lines.back().rfind("KeyError: ", 0), 0u);
    for (const auto& line : lines) {
        EXPECT_EQ(line.find(protocol::kResultSentinel), std::string::npos);
    }
}

TEST_F(LocalEnvironmentTest, StreamWithoutResultHasNoSummary) {
    LocalEnvironment environment(PythonConfig());
    const auto lines = environment.ExecuteStream("print('only')\n").Collect();
    EXPECT_EQ(lines, (std::vector<std::string>{"only"}));
}

TEST_F(LocalEnvironmentTest, StreamTimesOut) {
    LocalEnvironment environment(PythonConfig(0.5));
    const auto lines = environment.ExecuteStream("import time\nprint('tick', flush=True)\ntime.sleep(30)\n").Collect();
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "tick");
    EXPECT_EQ(lines.back().rfind("TimeoutError: ", 0), 0u);
    EXPECT_TRUE(environment.registry().ListProcesses().empty());
}

TEST_F(LocalEnvironmentTest, AbandonedStreamKillsProcess) {
    LocalEnvironment environment(PythonConfig());
    {
        auto stream = environment.ExecuteStream("import time\nprint('first', flush=True)\ntime.sleep(30)\n");
        EXPECT_EQ(stream.Next(), "first");
    }
    EXPECT_TRUE(environment.registry().ListProcesses().empty());
}

TEST_F(LocalEnvironmentTest, CommandSuccessReturnsStdout) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.ExecuteCommand("echo hello && echo world");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.result.AsString(), "hello\nworld\n");
    EXPECT_EQ(result.stdout_text, "hello\nworld\n");
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(LocalEnvironmentTest, CommandFailureIsCommandError) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.ExecuteCommand("echo broken >&2; exit 2");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, protocol::kCommandError);
    EXPECT_EQ(result.error, "broken");
    EXPECT_EQ(result.exit_code, 2);

    const auto silent = environment.ExecuteCommand("exit 4");
    EXPECT_EQ(silent.error, "Command exited with code 4");
}

TEST_F(LocalEnvironmentTest, UnknownCommandIsCommandNotFound) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.ExecuteCommand("execbox-no-such-command --flag");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, protocol::kCommandNotFoundError);
    EXPECT_EQ(result.exit_code, 127);
}

TEST_F(LocalEnvironmentTest, CommandTimesOut) {
    LocalEnvironment environment(PythonConfig(0.5));
    const auto result = environment.ExecuteCommand("sleep 30");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, protocol::kTimeoutError);
}

TEST_F(LocalEnvironmentTest, CommandStreamRelaysRawLines) {
    LocalEnvironment environment(PythonConfig());
    const auto lines = environment.ExecuteCommandStream("printf 'a\\nb\\n'; printf 'tail'").Collect();
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "tail"}));
}

TEST_F(LocalEnvironmentTest, MissingInterpreterIsCommandNotFound) {
    auto config = PythonConfig();
    config.executable = "execbox-no-such-python";
    LocalEnvironment environment(config);
    const auto result = environment.Execute("_result = 1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, protocol::kCommandNotFoundError);
}

TEST_F(LocalEnvironmentTest, IsolatedCallsDoNotShareState) {
    LocalEnvironment environment(PythonConfig());
    environment.Execute("shared = 10\n");
    const auto result = environment.Execute("_result = shared\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "NameError");
}

TEST_F(LocalEnvironmentTest, SharedInterpreterKeepsState) {
    LocalEnvironment environment(PythonConfig(30.0, false));
    EnvironmentSession session(environment);

    ASSERT_TRUE(session->Execute("counter = 41\n").success);
    const auto result = session->Execute("counter += 1\n_result = counter\n");
    ASSERT_TRUE(result.success) << result.error.value_or("") << result.stderr_text;
    EXPECT_EQ(result.result.AsInteger(), 42);
}

TEST_F(LocalEnvironmentTest, SharedInterpreterDoesNotLeakPreviousResult) {
    LocalEnvironment environment(PythonConfig(30.0, false));
    ASSERT_TRUE(environment.Execute("def main():\n    return 1\n").success);
    const auto result = environment.Execute("x = 2\n");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.result.is_null());
}

TEST_F(LocalEnvironmentTest, SharedInterpreterRecoversAfterTimeout) {
    LocalEnvironment environment(PythonConfig(1.0, false));
    ASSERT_TRUE(environment.Execute("value = 1\n").success);

    const auto timed_out = environment.Execute("import time\ntime.sleep(30)\n");
    EXPECT_EQ(timed_out.error_type, protocol::kTimeoutError);

    const auto fresh = environment.Execute("_result = 'value' in globals()\n");
    ASSERT_TRUE(fresh.success) << fresh.stderr_text;
    EXPECT_FALSE(fresh.result.AsBool());
}

TEST_F(LocalEnvironmentTest, SharedInterpreterSeparatesOutputPerCall) {
    LocalEnvironment environment(PythonConfig(30.0, false));
    const auto first = environment.Execute("print('first')\n");
    const auto second = environment.Execute("print('second')\n_result = 2\n");
    EXPECT_EQ(first.stdout_text, "first\n");
    EXPECT_EQ(second.stdout_text, "second\n");
    EXPECT_EQ(second.result.AsInteger(), 2);
}

TEST_F(LocalEnvironmentTest, SharedInterpreterStreams) {
    LocalEnvironment environment(PythonConfig(30.0, false));
    environment.Execute("base = 5\n");
    const auto lines = environment.ExecuteStream("print('streamed')\n_result = base * 2\n").Collect();
    EXPECT_EQ(lines, (std::vector<std::string>{"streamed", "Result: 10"}));

    const auto after = environment.Execute("_result = base\n");
    ASSERT_TRUE(after.success);
    EXPECT_EQ(after.result.AsInteger(), 5);
}

TEST_F(LocalEnvironmentTest, VeryLongErrorLineIsClassified) {
    LocalEnvironment environment(PythonConfig());
    const auto result = environment.Execute(
        "import sys\nsys.stderr.write('RuntimeError: ' + 'x' * 40000 + '\\n')\nsys.stderr.flush()\nsys.exit(1)\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "RuntimeError");
    EXPECT_EQ(result.error, std::string(40000, 'x'));
}

std::string JoinOutput(const std::vector<process::ProcessEvent>& events, process::OutputStream stream) {
    std::string text;
    for (const auto& event : events) {
        if (const auto* output = std::get_if<process::OutputEvent>(&event)) {
            if (output->stream == stream) {
                text += output->data;
            }
        }
    }
    return text;
}

TEST_F(LocalEnvironmentTest, StreamCodeRelaysProcessEvents) {
    LocalEnvironment environment(PythonConfig());
    const auto events = environment.StreamCode("print('one')\nprint('two', flush=True)\n_result = 3\n").Collect();
    ASSERT_GE(events.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<process::ProcessStartedEvent>(events.front()));
    EXPECT_EQ(std::get<process::ProcessStartedEvent>(events.front()).command, "python");
    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events.back()));
    EXPECT_EQ(std::get<process::ProcessCompletedEvent>(events.back()).exit_code, 0);
    EXPECT_EQ(JoinOutput(events, process::OutputStream::kStdout), "one\ntwo\n");
    EXPECT_TRUE(environment.registry().ListProcesses().empty());
}

TEST_F(LocalEnvironmentTest, StreamCodeTimeoutEndsWithInterruptedCompletion) {
    LocalEnvironment environment(PythonConfig(0.5));
    const auto events = environment.StreamCode("import time\nprint('tick', flush=True)\ntime.sleep(30)\n").Collect();
    ASSERT_FALSE(events.empty());
    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events.back()));
    EXPECT_EQ(std::get<process::ProcessCompletedEvent>(events.back()).exit_code, process::kInterruptedExitCode);
    EXPECT_EQ(JoinOutput(events, process::OutputStream::kStdout), "tick\n");
    EXPECT_TRUE(environment.registry().ListProcesses().empty());
}

TEST_F(LocalEnvironmentTest, StreamCommandRelaysBothStreams) {
    LocalEnvironment environment(PythonConfig());
    const auto events = environment.StreamCommand("echo out; echo err >&2; exit 4").Collect();
    ASSERT_GE(events.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<process::ProcessStartedEvent>(events.front()));
    EXPECT_EQ(std::get<process::ProcessStartedEvent>(events.front()).command, "echo out; echo err >&2; exit 4");
    EXPECT_EQ(JoinOutput(events, process::OutputStream::kStdout), "out\n");
    EXPECT_EQ(JoinOutput(events, process::OutputStream::kStderr), "err\n");
    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events.back()));
    EXPECT_EQ(std::get<process::ProcessCompletedEvent>(events.back()).exit_code, 4);
}

TEST_F(LocalEnvironmentTest, SharedInterpreterStreamCodeReplaysReply) {
    LocalEnvironment environment(PythonConfig(30.0, false));
    ASSERT_TRUE(environment.Execute("base = 2\n").success);
    const auto events = environment.StreamCode("print(base * 3)\n").Collect();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(JoinOutput(events, process::OutputStream::kStdout), "6\n");
    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events.back()));
    EXPECT_EQ(std::get<process::ProcessCompletedEvent>(events.back()).exit_code, 0);
}

TEST(LocalEnvironmentConfigTest, RejectsUnknownLanguage) {
    config::ExecutionConfig config{};
    config.language = "cobol";
    EXPECT_THROW(LocalEnvironment{config}, std::invalid_argument);
}

TEST(LocalEnvironmentJavaScriptTest, ReturnsValueOfMain) {
    EXECBOX_REQUIRE_EXECUTABLE("node");
    config::ExecutionConfig config{};
    config.language = "javascript";
    LocalEnvironment environment(config);

    const auto result = environment.Execute("async function main() { return { sum: 1 + 2 }; }");
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.result.Find("sum")->AsInteger(), 3);
}

TEST(LocalEnvironmentJavaScriptTest, ReportsThrownErrors) {
    EXECBOX_REQUIRE_EXECUTABLE("node");
    config::ExecutionConfig config{};
    config.language = "javascript";
    LocalEnvironment environment(config);

    const auto result = environment.Execute("throw new TypeError('nope');");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "TypeError");
    EXPECT_EQ(result.error, "nope");
}

TEST(LocalEnvironmentJavaScriptTest, ResultVariableAndOpaqueValues) {
    EXECBOX_REQUIRE_EXECUTABLE("node");
    config::ExecutionConfig config{};
    config.language = "javascript";
    LocalEnvironment environment(config);

    const auto result = environment.Execute("console.log('hi');\nconst _result = [1, () => 2];");
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "hi\n");
    const auto& items = result.result.AsSequence();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].AsInteger(), 1);
    EXPECT_EQ(items[1].kind(), protocol::Value::Kind::kOpaque);
}

}  // namespace
}  // namespace execbox::execution
