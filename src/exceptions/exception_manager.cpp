//
// Created by cory on 5/3/25.
//

#include "exceptions/exception_manager.hpp"
#include "logger.hpp"

ExceptionManager manager;

ExceptionManager& exception_manager()
{
    return manager;
}

static void log_exception(const std::exception& e)
{
    logger().err("Unhandled exception: %s", e.what());
}

ExceptionManager::ExceptionManager() : on_exception(log_exception), count(0)
{}

void ExceptionManager::handle_exception(const std::exception& e) const
{
    count.fetch_add(1, std::memory_order_relaxed);
    on_exception(e);
}

void ExceptionManager::set_handler(handler exception_handler)
{
    on_exception = exception_handler ? std::move(exception_handler) : handler(log_exception);
}
