#pragma once

#include "Logger/Logger.hpp"

namespace warlens::match {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace warlens::match
