#pragma once

#include "Logger/Logger.hpp"

namespace banchess::network::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace banchess::network::core
