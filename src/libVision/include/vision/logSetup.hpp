#pragma once

#include "Logger/LogConfig.hpp"

#include <string_view>

namespace warlens {

/*! Enable logging of every level to `<default log dir>/<component>/log.txt`, plus the console in debug builds.
 * \param [in,out] config    Configuration to set up. Must outlive every logger created from it.
 * \param [in]     component Log directory below the default one, e.g. "WarLens/Vision".
 */
void configureLogging(Logging::LogConfig& config, std::string_view component);

} // namespace warlens
