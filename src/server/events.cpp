/*
 * sandterm C++ - Realtime Event Frames Implementation
 */
#include <sandterm/server/events.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {
namespace events {

const char* const HELLO = "hello";
const char* const EXECUTE_COMMAND = "execute_command";
const char* const CANCEL_COMMAND = "cancel_command";
const char* const TERMINAL_STATUS = "terminal_status";
const char* const START_TERMINAL = "start_terminal";
const char* const STOP_TERMINAL = "stop_terminal";
const char* const PING = "ping";

const char* const CONNECTED = "connected";
const char* const COMMAND_STARTED = "command_started";
const char* const COMMAND_OUTPUT = "command_output";
const char* const COMMAND_COMPLETED = "command_completed";
const char* const COMMAND_ERROR = "command_error";
const char* const TERMINAL_CLEAR = "terminal_clear";
const char* const DATABASE_CHANGED = "database_changed";
const char* const PONG = "pong";
const char* const ERROR = "error";

} // namespace events

std::string encode_frame(const std::string& event, const Json& data) {
    Json frame;
    frame["event"] = event;
    frame["data"] = data.is_null() ? Json::object() : data;
    return frame.dump(-1, ' ', false, Json::error_handler_t::replace) + "\n";
}

bool parse_frame(const std::string& line, std::string& event, Json& frame, std::string& error) {
    try {
        frame = Json::parse(line);
    } catch (const Json::exception&) {
        error = "Malformed frame";
        return false;
    }

    if (!frame.is_object() || !frame.contains("event") || !frame["event"].is_string()) {
        error = "Frame must be an object with a string \"event\"";
        return false;
    }
    event = frame["event"].get<std::string>();

    if (!frame.contains("data") || frame["data"].is_null()) {
        frame["data"] = Json::object();
    }
    return true;
}

Json output_payload(OutputStream stream, const std::string& text) {
    Json payload;
    payload["type"] = stream_name(stream);
    payload["data"] = sanitize_utf8(text);
    return payload;
}

Json error_payload(const ExecError& error) {
    Json payload;
    payload["error"] = sanitize_utf8(error.display());
    payload["kind"] = error_kind_name(error.kind);
    if (!error.remediation.empty()) {
        payload["remediation"] = error.remediation;
    }
    if (error.exit_code >= 0) {
        payload["exitCode"] = error.exit_code;
    }
    return payload;
}

} // namespace sandterm
