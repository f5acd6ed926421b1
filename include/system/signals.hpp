#pragma once

#include "util/cancel.hpp"

#include <atomic>

namespace updsrv {

extern std::atomic_bool g_cancel;

// SIGINT/SIGTERM request cancellation of running builds; a second signal
// terminates immediately. SIGPIPE is ignored so that a closed output
// surfaces as a write error.
void InstallSignalHandlers();

CancelToken ProcessCancelToken();

} // namespace updsrv
