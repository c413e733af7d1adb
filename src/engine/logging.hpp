#pragma once

#include "Logger/Logger.hpp"

namespace banchess::engine {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace banchess::engine
