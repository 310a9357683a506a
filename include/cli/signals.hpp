#pragma once

namespace cw::cli {

// SIGINT/SIGTERM only raise a flag; the upload command turns it into Workflow::cancel().
void installSignalHandlers();
[[nodiscard]] bool interruptRequested();

}
