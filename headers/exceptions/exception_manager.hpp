//
// Created by cory on 5/3/25.
//

#ifndef KELP_EXCEPTION_MANAGER_HPP
#define KELP_EXCEPTION_MANAGER_HPP


#include <atomic>
#include <exception>
#include <functional>
#include <utility>

/**
 * Receives exceptions that were caught somewhere they could not be propagated, such as
 * a packet that failed to decode. The default handler logs the exception's message.
 */
class ExceptionManager
{
public:
    typedef std::function<void(const std::exception&)> handler;

    ExceptionManager();

    /**
     * Counts the exception and passes it to the handler. Packets decoded on different threads
     * report here concurrently, so the handler has to be safe to call from several threads.
     */
    void handle_exception(const std::exception& e) const;

    /**
     * Replaces the handler. Passing an empty handler restores the default one.
     *
     * @note Not thread safe, install handlers before any packet is read.
     */
    void set_handler(handler exception_handler);

    /**
     * @return How many exceptions were handled, safe to call while other threads report.
     */
    [[nodiscard]] inline unsigned long handled() const { return count.load(std::memory_order_relaxed); }
private:
    handler on_exception;
    mutable std::atomic<unsigned long> count;
};

/**
 * @return The process-wide exception manager.
 */
ExceptionManager& exception_manager();


#endif //KELP_EXCEPTION_MANAGER_HPP
