#include "swarmsync/errors.hpp"

namespace swarmsync {

const char* to_string(RequestErrorKind kind) {
    switch (kind) {
        case RequestErrorKind::rate_limited: return "rate limited";
        case RequestErrorKind::clock_out_of_sync: return "clock out of sync";
        case RequestErrorKind::unauthorized: return "unauthorized";
        case RequestErrorKind::missing_capability: return "missing capability";
        case RequestErrorKind::timeout: return "timeout";
        case RequestErrorKind::transport: return "transport failure";
        case RequestErrorKind::invalid_response: return "invalid response";
        case RequestErrorKind::ran_out_of_nodes: return "ran out of nodes";
    }
    return "unknown";
}

const char* to_string(MessageErrorKind kind) {
    switch (kind) {
        case MessageErrorKind::duplicate_message: return "duplicate message";
        case MessageErrorKind::duplicate_control_message: return "duplicate control message";
        case MessageErrorKind::duplicate_message_new_node: return "duplicate message from new node";
        case MessageErrorKind::self_send: return "self send";
        case MessageErrorKind::invalid_message: return "invalid message";
        case MessageErrorKind::decrypt_failed: return "decryption failed";
    }
    return "unknown";
}

}  // namespace swarmsync
