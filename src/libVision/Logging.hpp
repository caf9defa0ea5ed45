#pragma once

#include "Logger/Logger.hpp"

namespace warlens::vision {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace warlens::vision
