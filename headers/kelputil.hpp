//
// Created by cory on 1/16/25.
//

#ifndef KELP_KELPUTIL_HPP
#define KELP_KELPUTIL_HPP

// KELP_DEBUG is set by the build (option KELP_DEBUG)
#ifdef KELP_DEBUG

#include "logger.hpp"
#define debug(stmt) stmt

#else

// do nothing
#define debug(stmt)

#endif

#endif //KELP_KELPUTIL_HPP
