#pragma once

#include <optional>
#include <string>
#include <vector>

#include "protocol/execution_result.hpp"

namespace execbox::protocol {

// Marks the single stdout line that carries the JSON result payload.
inline constexpr const char* kResultSentinel = "__EXECBOX_RESULT_5f3c9a1e__";

enum class Language {
    kPython,
    kJavaScript
};

std::optional<Language> ParseLanguage(const std::string& name);
const char* ToString(Language language);
std::string DefaultExecutable(Language language);
std::string ScriptExtension(Language language);
std::vector<std::string> InterpreterArgs(Language language, const std::string& script_path);

// Builds a standalone program that runs `code`, captures `main()` (awaited
// when it returns an awaitable) or `_result`, and prints the sentinel line.
std::string Wrap(const std::string& code, Language language);

struct SentinelMatch {
    std::string payload;
    std::string remaining_stdout;
};

std::optional<SentinelMatch> ExtractSentinel(const std::string& stdout_text);

struct ExceptionInfo {
    std::string type;
    std::string message;
};

// Finds the last "SomeError: message" line of an exception trace.
std::optional<ExceptionInfo> ClassifyStderr(const std::string& stderr_text);

// Never throws: malformed payloads degrade to a ProtocolError failure.
ExecutionResult Decode(const std::string& stdout_text,
                       const std::string& stderr_text,
                       int exit_code,
                       double duration = 0.0);

// Long-lived interpreter wire: one JSON request per stdin line, each reply is
// the sentinel line followed by DoneMarker(id) on stdout and stderr.
std::string InterpreterServerProgram();
std::string EncodeRequest(const std::string& request_id, const std::string& code);
std::string DoneMarker(const std::string& request_id);

}  // namespace execbox::protocol
