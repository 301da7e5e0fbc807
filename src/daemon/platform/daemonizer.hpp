#pragma once

namespace platform {

// Detach from the controlling terminal and redirect stdio to /dev/null.
void daemonize();

} // namespace platform
