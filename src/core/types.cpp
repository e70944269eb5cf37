#include <sandterm/core/types.hpp>

namespace sandterm {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::INFRASTRUCTURE: return "infrastructure";
        case ErrorKind::EXECUTION: return "execution";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CANCELLATION: return "cancellation";
    }
    return "unknown";
}

const char* outcome_name(InvocationOutcome outcome) {
    switch (outcome) {
        case InvocationOutcome::RUNNING: return "running";
        case InvocationOutcome::SUCCESS: return "success";
        case InvocationOutcome::FAILURE: return "failure";
        case InvocationOutcome::TIMEOUT: return "timeout";
        case InvocationOutcome::CANCELED: return "canceled";
        case InvocationOutcome::REJECTED: return "rejected";
    }
    return "unknown";
}

const char* stream_name(OutputStream stream) {
    switch (stream) {
        case OutputStream::STDOUT: return "stdout";
        case OutputStream::STDERR: return "stderr";
        case OutputStream::INFO: return "info";
        case OutputStream::ERROR: return "error";
    }
    return "stdout";
}

} // namespace sandterm
