#include "runtime/cancellation.h"

namespace kvplane {

std::atomic<bool> g_running_flag{true};

}  // namespace kvplane
