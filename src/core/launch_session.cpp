#include "devmux/core/launch_session.h"

namespace devmux {
namespace core {

const char* sessionKindToString(SessionKind kind) {
    switch (kind) {
        case SessionKind::App: return "app";
        case SessionKind::Media: return "media";
        case SessionKind::ExternalInputPicker: return "input picker";
        case SessionKind::WebApp: return "web app";
        case SessionKind::Unknown:
        default: return "unknown";
    }
}

} // namespace core
} // namespace devmux
