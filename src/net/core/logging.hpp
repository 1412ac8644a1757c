#pragma once

#include "Logger/Logger.hpp"

namespace noughts::network::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace noughts::network::core
