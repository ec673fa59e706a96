//
// Created by cory on 4/12/25.
//

#ifndef KELP_LOGGER_HPP
#define KELP_LOGGER_HPP


#include "loggerimpl.hpp"

/**
 * @return The process-wide logger.
 */
Logger& logger();


#endif //KELP_LOGGER_HPP
