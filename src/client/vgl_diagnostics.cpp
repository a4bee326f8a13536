#include "vgl/client/vgl_diagnostics.h"

namespace vgl {
namespace client {

void LoggerDiagnostics::record(const DiagnosticEvent& event) {
    Logger::instance().write(event.level, event.component.c_str(), event.message.c_str());
}

}  // namespace client
}  // namespace vgl
