#pragma once

namespace agora::messaging {

// Outcome of a delivery or suspending operation
enum class DeliveryStatus {
    OK,
    UNKNOWN_AGENT,       // Receiver not registered with the router
    MAILBOX_FULL,        // Bounded mailbox refused the message
    TIMED_OUT,           // Deadline elapsed before the operation could complete
    CANCELLED,           // Caller's cancellation token fired
    CLOSED,              // Mailbox closed (owner deregistered)
    INVALID_MESSAGE,     // Message does not fit the protocol exchange
    NO_PENDING_REQUEST   // No outstanding request for the conversation
};

const char* delivery_status_to_string(DeliveryStatus status);

struct SendResult {
    DeliveryStatus status = DeliveryStatus::OK;

    bool ok() const { return status == DeliveryStatus::OK; }
};

} // namespace agora::messaging
