#include "messaging/status.hpp"

namespace agora::messaging {

const char* delivery_status_to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::OK:                 return "OK";
        case DeliveryStatus::UNKNOWN_AGENT:      return "UNKNOWN_AGENT";
        case DeliveryStatus::MAILBOX_FULL:       return "MAILBOX_FULL";
        case DeliveryStatus::TIMED_OUT:          return "TIMED_OUT";
        case DeliveryStatus::CANCELLED:          return "CANCELLED";
        case DeliveryStatus::CLOSED:             return "CLOSED";
        case DeliveryStatus::INVALID_MESSAGE:    return "INVALID_MESSAGE";
        case DeliveryStatus::NO_PENDING_REQUEST: return "NO_PENDING_REQUEST";
        default: return "UNKNOWN";
    }
}

} // namespace agora::messaging
