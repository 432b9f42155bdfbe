#pragma once

#include <fmt/core.h>

namespace pkexport::compat {
    using fmt::format;
}
