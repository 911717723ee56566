#pragma once

// fmt is a hard build dependency of beacon_node; every message text is
// assembled through compat::format so the call sites stay independent of it.
#include <fmt/format.h>

namespace beacon::compat {
    using fmt::format;
}
