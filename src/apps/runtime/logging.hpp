#pragma once

#include "Logger/Logger.hpp"

namespace noughts::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace noughts::app
