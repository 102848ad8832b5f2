#pragma once

namespace platform {

// Detaches from the controlling terminal with a double fork and points
// stdio at /dev/null. Only the grandchild returns; false if a fork failed
// before the parent exited.
bool daemonize();

} // namespace platform
