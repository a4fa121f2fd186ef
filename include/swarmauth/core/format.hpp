#pragma once

#include <fmt/core.h>

namespace swarmauth::compat {
    using fmt::format;
}
