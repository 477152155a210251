#include <gtest/gtest.h>

#include <algorithm>
#include <variant>
#include <vector>

#include "execution/mock_environment.hpp"
#include "process/process_errors.hpp"

namespace execbox::execution {
namespace {

class MockEnvironmentTest : public ::testing::Test {
protected:
    MockEnvironmentTest()
        : environment_(
              {
                  {"print(1)", protocol::MakeSuccess(protocol::Value(1), 0.01, "1\n", "", 0)},
                  {"raise ValueError()",
                   protocol::MakeFailure("bad", "ValueError", 0.01, "", "ValueError: bad\n", 1)},
              },
              {
                  {"echo hello", protocol::MakeSuccess(protocol::Value("hello\n"), 0.01, "hello\n", "", 0)},
                  {"ls /nonexistent",
                   protocol::MakeFailure("No such file or directory", protocol::kCommandError, 0.01, "",
                                         "No such file or directory\n", 2)},
              },
              {
                  {"echo", process::ProcessOutput{"hello world", "", "hello world", 0}},
                  {"sleep", process::ProcessOutput{"", "", "", 0}},
              }) {}

    MockEnvironment environment_;
};

TEST_F(MockEnvironmentTest, ReturnsPredefinedCodeResult) {
    const auto result = environment_.Execute("print(1)");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "1\n");
    EXPECT_EQ(result.result.AsInteger(), 1);
    EXPECT_EQ(environment_.executed_code(), (std::vector<std::string>{"print(1)"}));
}

TEST_F(MockEnvironmentTest, UnknownCodeGetsDefaultResult) {
    const auto result = environment_.Execute("unknown_code()");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.result.is_null());
    EXPECT_EQ(result.stdout_text, "");
}

TEST_F(MockEnvironmentTest, CustomDefaultResult) {
    environment_.SetDefaultResult(protocol::MakeSuccess(protocol::Value("custom"), 1.0, "custom output", "", 0));
    const auto result = environment_.Execute("anything");
    EXPECT_EQ(result.stdout_text, "custom output");
    EXPECT_EQ(result.result.AsString(), "custom");
}

TEST_F(MockEnvironmentTest, ReturnsPredefinedCommandResults) {
    const auto ok = environment_.ExecuteCommand("echo hello");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.stdout_text, "hello\n");
    EXPECT_EQ(ok.exit_code, 0);

    const auto failed = environment_.ExecuteCommand("ls /nonexistent");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.stderr_text, "No such file or directory\n");
    EXPECT_EQ(failed.exit_code, 2);
    EXPECT_EQ(environment_.executed_commands().size(), 2u);
}

TEST_F(MockEnvironmentTest, StreamsOutputAndSummary) {
    EXPECT_EQ(environment_.ExecuteStream("print(1)").Collect(),
              (std::vector<std::string>{"1", "Result: 1"}));
    EXPECT_EQ(environment_.ExecuteStream("raise ValueError()").Collect(),
              (std::vector<std::string>{"ValueError: bad", "ValueError: bad"}));
    EXPECT_EQ(environment_.ExecuteCommandStream("echo hello").Collect(),
              (std::vector<std::string>{"hello"}));
}

TEST_F(MockEnvironmentTest, StreamCodeEmitsStartedOutputCompleted) {
    const auto events = environment_.StreamCode("print(1)").Collect();
    ASSERT_EQ(events.size(), 3u);

    ASSERT_TRUE(std::holds_alternative<process::ProcessStartedEvent>(events[0]));
    EXPECT_EQ(std::get<process::ProcessStartedEvent>(events[0]).command, "python");

    ASSERT_TRUE(std::holds_alternative<process::OutputEvent>(events[1]));
    const auto& output = std::get<process::OutputEvent>(events[1]);
    EXPECT_EQ(output.data, "1\n");
    EXPECT_EQ(output.stream, process::OutputStream::kStdout);

    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events[2]));
    EXPECT_EQ(std::get<process::ProcessCompletedEvent>(events[2]).exit_code, 0);
}

TEST_F(MockEnvironmentTest, StreamCodeReportsFailuresOnStderr) {
    const auto events = environment_.StreamCode("raise ValueError()").Collect();

    std::vector<process::OutputEvent> outputs;
    std::vector<process::ProcessCompletedEvent> completions;
    for (const auto& event : events) {
        if (const auto* output = std::get_if<process::OutputEvent>(&event)) {
            outputs.push_back(*output);
        } else if (const auto* completed = std::get_if<process::ProcessCompletedEvent>(&event)) {
            completions.push_back(*completed);
        }
    }
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].stream, process::OutputStream::kStderr);
    EXPECT_EQ(outputs[0].data, "ValueError: bad\n");
    ASSERT_EQ(completions.size(), 1u);
    EXPECT_EQ(completions[0].exit_code, 1);
}

TEST_F(MockEnvironmentTest, StreamCommandEmitsStartedOutputCompleted) {
    const auto events = environment_.StreamCommand("echo hello").Collect();
    ASSERT_EQ(events.size(), 3u);

    ASSERT_TRUE(std::holds_alternative<process::ProcessStartedEvent>(events[0]));
    EXPECT_EQ(std::get<process::ProcessStartedEvent>(events[0]).command, "echo hello");
    ASSERT_TRUE(std::holds_alternative<process::OutputEvent>(events[1]));
    EXPECT_EQ(std::get<process::OutputEvent>(events[1]).data, "hello\n");
    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events[2]));
    EXPECT_EQ(environment_.executed_commands(), (std::vector<std::string>{"echo hello"}));
}

TEST_F(MockEnvironmentTest, StreamedFailureWithoutStderrNamesTheError) {
    environment_.SetCodeResult("boom", protocol::MakeFailure("gone", "RuntimeError", 0.0, "", "", std::nullopt));
    const auto events = environment_.StreamCode("boom").Collect();
    ASSERT_EQ(events.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<process::OutputEvent>(events[1]));
    EXPECT_EQ(std::get<process::OutputEvent>(events[1]).data, "RuntimeError: gone\n");
    ASSERT_TRUE(std::holds_alternative<process::ProcessCompletedEvent>(events[2]));
    EXPECT_EQ(std::get<process::ProcessCompletedEvent>(events[2]).exit_code, 1);
}

TEST_F(MockEnvironmentTest, SessionStartsAndStops) {
    {
        EnvironmentSession session(environment_);
        EXPECT_TRUE(environment_.started());
        EXPECT_EQ(session->Execute("print(1)").stdout_text, "1\n");
    }
    EXPECT_FALSE(environment_.started());
}

TEST_F(MockEnvironmentTest, ProcessManagerStartsAndLists) {
    auto& manager = environment_.process_manager();
    const auto id = manager.StartProcess("echo", {"hello", "world"}, "", {});
    EXPECT_EQ(id.rfind("mock_", 0), 0u);
    const auto ids = manager.ListProcesses();
    EXPECT_NE(std::find(ids.begin(), ids.end(), id), ids.end());

    const auto output = manager.GetOutput(id);
    EXPECT_EQ(output.stdout_text, "hello world");
    EXPECT_EQ(output.exit_code, 0);
}

TEST_F(MockEnvironmentTest, ProcessManagerKillRecordsInterrupt) {
    auto& manager = environment_.process_manager();
    const auto id = manager.StartProcess("sleep", {"100"}, "", {});
    EXPECT_TRUE(manager.GetProcessInfo(id).is_running);
    manager.KillProcess(id);

    const auto info = manager.GetProcessInfo(id);
    EXPECT_FALSE(info.is_running);
    EXPECT_EQ(info.exit_code, process::kInterruptedExitCode);
}

TEST_F(MockEnvironmentTest, ProcessManagerWaitAndInfo) {
    auto& manager = environment_.process_manager();
    const auto id = manager.StartProcess("echo", {"hello"}, "/tmp", {});
    EXPECT_EQ(manager.WaitForExit(id), 0);

    const auto info = process::ToJson(manager.GetProcessInfo(id));
    EXPECT_EQ(info["process_id"], id);
    EXPECT_EQ(info["command"], "echo");
    EXPECT_EQ(info["args"], nlohmann::ordered_json::array({"hello"}));
    EXPECT_EQ(info["cwd"], "/tmp");
    EXPECT_EQ(info["is_running"], false);
    EXPECT_TRUE(info.contains("created_at"));
}

TEST_F(MockEnvironmentTest, ProcessManagerReleaseAndNotFound) {
    auto& manager = environment_.process_manager();
    const auto id = manager.StartProcess("echo", {}, "", {});
    manager.ReleaseProcess(id);
    EXPECT_TRUE(manager.ListProcesses().empty());

    EXPECT_THROW(manager.GetOutput("nonexistent"), process::ProcessNotFoundError);
    EXPECT_THROW(manager.KillProcess("nonexistent"), process::ProcessNotFoundError);
    EXPECT_THROW(manager.ReleaseProcess(id), process::ProcessNotFoundError);
}

TEST(MockProcessManagerTest, LooksUpFullCommandLineBeforeName) {
    MockProcessManager manager(process::ProcessOutput{"default output", "", "default output", 0},
                               {{"custom cmd", process::ProcessOutput{"custom", "", "custom", 42}}});

    const auto first = manager.StartProcess("unknown", {}, "", {});
    EXPECT_EQ(manager.GetOutput(first).stdout_text, "default output");

    const auto second = manager.StartProcess("custom", {"cmd"}, "", {});
    const auto output = manager.GetOutput(second);
    EXPECT_EQ(output.stdout_text, "custom");
    EXPECT_EQ(output.exit_code, 42);
    EXPECT_EQ(manager.WaitForExit(second), 42);
}

}  // namespace
}  // namespace execbox::execution
