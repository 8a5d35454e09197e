#include "event_sink.h"

namespace lanmeet {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING:   return "connecting";
        case ConnectionState::CONNECTED:    return "connected";
        case ConnectionState::DISCONNECTED: return "disconnected";
    }
    return "unknown";
}

} // namespace lanmeet
