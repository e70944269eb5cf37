/*
 * sandterm C++ - Realtime Event Frames
 *
 * Newline-delimited JSON. The first client frame is
 *   {"event":"hello","token":"..."}
 * and every frame after that, in both directions, is
 *   {"event":"<name>","data":{...}}
 */
#ifndef sandterm_SERVER_EVENTS_HPP
#define sandterm_SERVER_EVENTS_HPP

#include <sandterm/core/json.hpp>
#include <sandterm/core/types.hpp>
#include <string>

namespace sandterm {
namespace events {

// client -> server
extern const char* const HELLO;
extern const char* const EXECUTE_COMMAND;
extern const char* const CANCEL_COMMAND;
extern const char* const TERMINAL_STATUS;
extern const char* const START_TERMINAL;
extern const char* const STOP_TERMINAL;
extern const char* const PING;

// server -> client
extern const char* const CONNECTED;
extern const char* const COMMAND_STARTED;
extern const char* const COMMAND_OUTPUT;
extern const char* const COMMAND_COMPLETED;
extern const char* const COMMAND_ERROR;
extern const char* const TERMINAL_CLEAR;
extern const char* const DATABASE_CHANGED;
extern const char* const PONG;
extern const char* const ERROR;

} // namespace events

// One frame, newline-terminated. Invalid UTF-8 in strings is replaced.
std::string encode_frame(const std::string& event, const Json& data);

// Parse one line. `data` is an empty object when the frame has none.
bool parse_frame(const std::string& line, std::string& event, Json& frame, std::string& error);

// {"type": "stdout"|"stderr"|"info"|"error", "data": text}
Json output_payload(OutputStream stream, const std::string& text);

// {"error": text, "kind": ..., "remediation": ...?, "exitCode": ...?}
Json error_payload(const ExecError& error);

} // namespace sandterm

#endif // sandterm_SERVER_EVENTS_HPP
