#include "messaging/performative.hpp"
#include <algorithm>
#include <cctype>

namespace agora::messaging {

const char* performative_to_string(Performative performative) {
    switch (performative) {
        case Performative::INFORM:     return "INFORM";
        case Performative::REQUEST:    return "REQUEST";
        case Performative::QUERY:      return "QUERY";
        case Performative::PROPOSE:    return "PROPOSE";
        case Performative::ACCEPT:     return "ACCEPT";
        case Performative::REJECT:     return "REJECT";
        case Performative::CONFIRM:    return "CONFIRM";
        case Performative::DISCONFIRM: return "DISCONFIRM";
        case Performative::SUBSCRIBE:  return "SUBSCRIBE";
        case Performative::CFP:        return "CFP";
        case Performative::REFUSE:     return "REFUSE";
        case Performative::AGREE:      return "AGREE";
        default: return "UNKNOWN";
    }
}

std::optional<Performative> performative_from_string(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "INFORM")     return Performative::INFORM;
    if (upper == "REQUEST")    return Performative::REQUEST;
    if (upper == "QUERY")      return Performative::QUERY;
    if (upper == "PROPOSE")    return Performative::PROPOSE;
    if (upper == "ACCEPT")     return Performative::ACCEPT;
    if (upper == "REJECT")     return Performative::REJECT;
    if (upper == "CONFIRM")    return Performative::CONFIRM;
    if (upper == "DISCONFIRM") return Performative::DISCONFIRM;
    if (upper == "SUBSCRIBE")  return Performative::SUBSCRIBE;
    if (upper == "CFP")        return Performative::CFP;
    if (upper == "REFUSE")     return Performative::REFUSE;
    if (upper == "AGREE")      return Performative::AGREE;
    return std::nullopt;
}

} // namespace agora::messaging
