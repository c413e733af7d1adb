#pragma once

#include "Logger/Logger.hpp"

namespace banchess::server {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace banchess::server
