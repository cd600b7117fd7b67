#pragma once
#include <optional>
#include <string>

namespace agora::messaging {

// Speech-act kind of a message. The fabric never branches on it;
// protocol layers may.
enum class Performative {
    INFORM,
    REQUEST,
    QUERY,
    PROPOSE,
    ACCEPT,
    REJECT,
    CONFIRM,
    DISCONFIRM,
    SUBSCRIBE,
    CFP,         // Call for proposals
    REFUSE,
    AGREE
};

const char* performative_to_string(Performative performative);

// Case-insensitive; nullopt for unknown names
std::optional<Performative> performative_from_string(const std::string& str);

} // namespace agora::messaging
