// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <string_view>

namespace tubeq::core {

// Replace the default logger: colored stderr, plus a file when `file` is set.
// Unknown level names fall back to "info".
void init_logging(std::string_view level, const std::string& file = {});

} // namespace tubeq::core
