/*
 * sandterm C++ - Common Types
 *
 * Error kinds, invocation outcomes and the identity of the user behind a
 * connection. Shared by every layer.
 */
#ifndef sandterm_CORE_TYPES_HPP
#define sandterm_CORE_TYPES_HPP

#include <string>
#include <cstdint>

namespace sandterm {

enum class ErrorKind {
    VALIDATION,
    INFRASTRUCTURE,
    EXECUTION,
    TIMEOUT,
    CANCELLATION
};

enum class InvocationOutcome {
    RUNNING,
    SUCCESS,
    FAILURE,
    TIMEOUT,
    CANCELED,
    REJECTED
};

// Which pipe a chunk came from; INFO/ERROR are server-generated lines
enum class OutputStream {
    STDOUT,
    STDERR,
    INFO,
    ERROR
};

const char* error_kind_name(ErrorKind kind);
const char* outcome_name(InvocationOutcome outcome);
const char* stream_name(OutputStream stream);

// Resolved by the identity layer when a connection authenticates
struct UserContext {
    std::string user_id;
    std::string username;

    UserContext() {}
    UserContext(const std::string& id, const std::string& name)
        : user_id(id), username(name) {}
};

// Terminal failure of an invocation or a backend operation
struct ExecError {
    ErrorKind kind;
    std::string message;        // Client-safe text
    std::string remediation;    // Optional hint for infrastructure errors
    int exit_code;              // Set for EXECUTION, -1 otherwise

    ExecError() : kind(ErrorKind::EXECUTION), exit_code(-1) {}
    ExecError(ErrorKind k, const std::string& msg, const std::string& hint = "", int code = -1)
        : kind(k), message(msg), remediation(hint), exit_code(code) {}

    // "message hint" as shown to the client
    std::string display() const {
        if (remediation.empty()) return message;
        return message + " " + remediation;
    }
};

} // namespace sandterm

#endif // sandterm_CORE_TYPES_HPP
