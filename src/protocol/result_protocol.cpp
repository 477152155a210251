#include "protocol/result_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

#include "utils/common.hpp"

namespace execbox::protocol {
namespace {

constexpr const char* kUncaughtPrefix = "Uncaught";
constexpr const char* kAnyPrefixSuffixes[] = {"Error", "Exception"};
constexpr const char* kNamedSuffixes[] = {"Exit", "Interrupt", "Warning"};

// Shared by the one-shot wrapper and the interpreter server. Expects the
// sentinel to be bound to _EXECBOX_SENTINEL before it runs.
constexpr const char* kPythonPrelude = R"PY(import asyncio as _execbox_asyncio
import inspect as _execbox_inspect
import json as _execbox_json
import sys as _execbox_sys
import traceback as _execbox_traceback


def _execbox_opaque(value):
    try:
        text = repr(value)
    except Exception:
        text = "<unrepresentable>"
    return {"__opaque__": text}


def _execbox_encode(payload):
    try:
        return _execbox_json.dumps(payload, default=_execbox_opaque, allow_nan=False)
    except (TypeError, ValueError, RecursionError):
        payload = dict(payload, result=_execbox_opaque(payload.get("result")))
        return _execbox_json.dumps(payload, default=_execbox_opaque)


def _execbox_emit(payload):
    line = _execbox_encode(payload)
    _execbox_sys.stdout.flush()
    _execbox_sys.stdout.write(_EXECBOX_SENTINEL + line + "\n")
    _execbox_sys.stdout.flush()


async def _execbox_await(awaitable):
    return await awaitable


def _execbox_evaluate(source, namespace):
    namespace.pop("main", None)
    namespace.pop("_result", None)
    exec(compile(source, "<execbox>", "exec"), namespace)
    entry = namespace.get("main")
    if callable(entry):
        value = entry()
        if _execbox_inspect.isawaitable(value):
            value = _execbox_asyncio.run(_execbox_await(value))
        return value
    return namespace.get("_result")


def _execbox_run(source, namespace):
    try:
        payload = {"success": True, "result": _execbox_evaluate(source, namespace)}
    except Exception as exc:
        _execbox_traceback.print_exc()
        _execbox_sys.stderr.flush()
        payload = {
            "success": False,
            "result": None,
            "error": str(exc) or type(exc).__name__,
            "error_type": type(exc).__name__,
        }
    _execbox_emit(payload)
)PY";

constexpr const char* kPythonServerLoop = R"PY(
_execbox_namespace = {"__name__": "__main__", "__builtins__": __builtins__}


def _execbox_serve():
    while True:
        raw = _execbox_sys.stdin.readline()
        if not raw:
            break
        raw = raw.strip()
        if not raw:
            continue
        try:
            request = _execbox_json.loads(raw)
        except ValueError:
            continue
        _execbox_run(request.get("code", ""), _execbox_namespace)
        marker = request.get("done", "")
        _execbox_sys.stdout.write(marker + "\n")
        _execbox_sys.stdout.flush()
        _execbox_sys.stderr.flush()
        _execbox_sys.stderr.write(marker + "\n")
        _execbox_sys.stderr.flush()


_execbox_serve()
)PY";

constexpr const char* kJavaScriptPrelude = R"JS("use strict";
function __execboxEncode(payload) {
  const seen = new WeakSet();
  return JSON.stringify(payload, (key, value) => {
    if (typeof value === "bigint" || typeof value === "function" || typeof value === "symbol") {
      return { __opaque__: String(value) };
    }
    if (typeof value === "number" && !Number.isFinite(value)) {
      return { __opaque__: String(value) };
    }
    if (value !== null && typeof value === "object") {
      if (seen.has(value)) {
        return { __opaque__: "[Circular]" };
      }
      seen.add(value);
    }
    return value;
  });
}
function __execboxEmit(payload) {
  process.stdout.write(__EXECBOX_SENTINEL + __execboxEncode(payload) + "\n");
}
)JS";

constexpr const char* kJavaScriptTrailer = R"JS(
__execboxEvaluate().then(
  (value) => {
    __execboxEmit({ success: true, result: value === undefined ? null : value });
  },
  (error) => {
    if (error && error.stack) {
      process.stderr.write(String(error.stack) + "\n");
    }
    const message = error && error.message !== undefined ? String(error.message) : String(error);
    const name = (error && error.name) || "Error";
    __execboxEmit({ success: false, result: null, error: message || name, error_type: name });
  });
)JS";

std::string JsonStringLiteral(const std::string& text) {
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string WrapPython(const std::string& code) {
    std::ostringstream program;
    program << "_EXECBOX_SENTINEL = " << JsonStringLiteral(kResultSentinel) << "\n";
    program << kPythonPrelude << "\n\n";
    program << "_execbox_run(" << JsonStringLiteral(code)
            << ", {\"__name__\": \"__main__\", \"__builtins__\": __builtins__})\n";
    return program.str();
}

std::string WrapJavaScript(const std::string& code) {
    std::ostringstream program;
    program << "const __EXECBOX_SENTINEL = " << JsonStringLiteral(kResultSentinel) << ";\n";
    program << kJavaScriptPrelude;
    program << "async function __execboxEvaluate() {\n";
    program << code << "\n";
    program << "  if (typeof main === \"function\") {\n";
    program << "    return await main();\n";
    program << "  }\n";
    program << "  if (typeof _result !== \"undefined\") {\n";
    program << "    return _result;\n";
    program << "  }\n";
    program << "  return null;\n";
    program << "}\n";
    program << kJavaScriptTrailer;
    return program.str();
}

std::string OptionalString(const nlohmann::ordered_json& payload, const char* key) {
    if (!payload.contains(key)) {
        return {};
    }
    const auto& value = payload[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool IsIdentifier(const std::string& text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '_';
    });
}

bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "Error"/"Exception" may stand alone; "Exit", "Interrupt" and "Warning"
// need a leading word (SystemExit, KeyboardInterrupt).
bool IsExceptionName(const std::string& name) {
    for (const char* suffix : kAnyPrefixSuffixes) {
        if (EndsWith(name, suffix)) {
            return true;
        }
    }
    for (const char* suffix : kNamedSuffixes) {
        if (name.size() > std::strlen(suffix) && EndsWith(name, suffix)) {
            return true;
        }
    }
    return false;
}

// Single left-to-right scan of `[Uncaught ]pkg.mod.Name[: message]`.
std::optional<ExceptionInfo> ParseExceptionLine(const std::string& line) {
    std::size_t pos = 0;
    const auto skip_spaces = [&] {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
    };
    skip_spaces();
    const auto uncaught_length = std::strlen(kUncaughtPrefix);
    if (line.compare(pos, uncaught_length, kUncaughtPrefix) == 0 &&
        pos + uncaught_length < line.size() &&
        std::isspace(static_cast<unsigned char>(line[pos + uncaught_length]))) {
        pos += uncaught_length;
        skip_spaces();
    }

    const auto token_start = pos;
    while (pos < line.size() &&
           (std::isalnum(static_cast<unsigned char>(line[pos])) || line[pos] == '_' || line[pos] == '.')) {
        ++pos;
    }
    const auto token = line.substr(token_start, pos - token_start);

    std::string message;
    if (pos < line.size() && line[pos] == ':') {
        message = utils::Trim(line.substr(pos + 1));
    } else if (!utils::Trim(line.substr(pos)).empty()) {
        return std::nullopt;
    }

    std::string name;
    std::size_t segment_start = 0;
    while (true) {
        const auto dot = token.find('.', segment_start);
        name = token.substr(segment_start, dot == std::string::npos ? std::string::npos : dot - segment_start);
        if (!IsIdentifier(name)) {
            return std::nullopt;
        }
        if (dot == std::string::npos) {
            break;
        }
        segment_start = dot + 1;
    }
    if (!IsExceptionName(name)) {
        return std::nullopt;
    }
    return ExceptionInfo{name, std::move(message)};
}

ExecutionResult DecodeUnchecked(const std::string& stdout_text,
                                const std::string& stderr_text,
                                int exit_code,
                                double duration) {
    if (auto match = ExtractSentinel(stdout_text)) {
        const auto payload = nlohmann::ordered_json::parse(match->payload, nullptr, false);
        if (payload.is_discarded() || !payload.is_object() ||
            !payload.contains("success") || !payload["success"].is_boolean()) {
            return MakeFailure("Malformed result payload: " + match->payload,
                               kProtocolError,
                               duration,
                               std::move(match->remaining_stdout),
                               stderr_text,
                               exit_code);
        }
        if (payload["success"].get<bool>()) {
            Value value = payload.contains("result") ? Value::FromJson(payload["result"]) : Value();
            return MakeSuccess(std::move(value),
                               duration,
                               std::move(match->remaining_stdout),
                               stderr_text,
                               exit_code);
        }
        return MakeFailure(OptionalString(payload, "error"),
                           OptionalString(payload, "error_type"),
                           duration,
                           std::move(match->remaining_stdout),
                           stderr_text,
                           exit_code);
    }

    if (exit_code == 0) {
        return MakeSuccess(Value(), duration, stdout_text, stderr_text, exit_code);
    }

    const auto info = ClassifyStderr(stderr_text);
    std::string error;
    if (info && !info->message.empty()) {
        error = info->message;
    } else if (const auto trimmed = utils::Trim(stderr_text); !trimmed.empty()) {
        error = trimmed;
    } else {
        error = "Process exited with code " + std::to_string(exit_code);
    }
    return MakeFailure(std::move(error),
                       info ? info->type : std::string(kCommandError),
                       duration,
                       stdout_text,
                       stderr_text,
                       exit_code);
}

}  // namespace

std::optional<Language> ParseLanguage(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "python" || lowered == "python3" || lowered == "py") {
        return Language::kPython;
    }
    if (lowered == "javascript" || lowered == "js" || lowered == "node") {
        return Language::kJavaScript;
    }
    return std::nullopt;
}

const char* ToString(Language language) {
    switch (language) {
        case Language::kPython: return "python";
        case Language::kJavaScript: return "javascript";
    }
    return "unknown";
}

std::string DefaultExecutable(Language language) {
    return language == Language::kJavaScript ? "node" : "python3";
}

std::string ScriptExtension(Language language) {
    return language == Language::kJavaScript ? ".js" : ".py";
}

std::vector<std::string> InterpreterArgs(Language language, const std::string& script_path) {
    if (language == Language::kPython) {
        return {"-u", script_path};
    }
    return {script_path};
}

std::string Wrap(const std::string& code, Language language) {
    switch (language) {
        case Language::kPython: return WrapPython(code);
        case Language::kJavaScript: return WrapJavaScript(code);
    }
    return WrapPython(code);
}

std::optional<SentinelMatch> ExtractSentinel(const std::string& stdout_text) {
    const auto pos = stdout_text.rfind(kResultSentinel);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const auto payload_start = pos + std::strlen(kResultSentinel);
    const auto line_end = stdout_text.find('\n', payload_start);
    SentinelMatch match{};
    if (line_end == std::string::npos) {
        match.payload = stdout_text.substr(payload_start);
        match.remaining_stdout = stdout_text.substr(0, pos);
    } else {
        match.payload = stdout_text.substr(payload_start, line_end - payload_start);
        match.remaining_stdout = stdout_text.substr(0, pos);
        if (pos > 0 && stdout_text[pos - 1] != '\n') {
            match.remaining_stdout += '\n';
        }
        match.remaining_stdout += stdout_text.substr(line_end + 1);
    }
    if (!match.payload.empty() && match.payload.back() == '\r') {
        match.payload.pop_back();
    }
    return match;
}

std::optional<ExceptionInfo> ClassifyStderr(const std::string& stderr_text) {
    std::size_t end = stderr_text.size();
    while (end > 0) {
        const auto newline = stderr_text.rfind('\n', end - 1);
        const auto start = newline == std::string::npos ? 0 : newline + 1;
        std::string line = stderr_text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            if (auto info = ParseExceptionLine(line)) {
                return info;
            }
        }
        if (newline == std::string::npos) {
            break;
        }
        end = newline;
    }
    return std::nullopt;
}

ExecutionResult Decode(const std::string& stdout_text,
                       const std::string& stderr_text,
                       int exit_code,
                       double duration) {
    try {
        return DecodeUnchecked(stdout_text, stderr_text, exit_code, duration);
    } catch (const std::exception& ex) {
        return MakeFailure(std::string("Failed to decode result: ") + ex.what(),
                           kProtocolError,
                           duration,
                           stdout_text,
                           stderr_text,
                           exit_code);
    }
}

std::string InterpreterServerProgram() {
    std::ostringstream program;
    program << "_EXECBOX_SENTINEL = " << JsonStringLiteral(kResultSentinel) << "\n";
    program << kPythonPrelude;
    program << kPythonServerLoop;
    return program.str();
}

std::string EncodeRequest(const std::string& request_id, const std::string& code) {
    nlohmann::json request = {
        {"id", request_id},
        {"code", code},
        {"done", DoneMarker(request_id)}
    };
    return request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string DoneMarker(const std::string& request_id) {
    return "__EXECBOX_DONE_" + request_id + "__";
}

}  // namespace execbox::protocol
