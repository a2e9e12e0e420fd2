#pragma once

#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "outcome.hpp"

// Receives the classified result of one attempt.
using OutcomeHandler = std::function<void(Outcome)>;

/**
 * @brief Abstract interface for executing one unit of work asynchronously.
 *
 * Each dispatch slot receives its own clone of an executor, bound to the
 * run's io_context, allowing it to keep its own connection state (like a
 * persistent HTTP connection) without needing locks.
 */
class IRequestExecutor {
public:
    virtual ~IRequestExecutor() = default;

    /**
     * @brief Checks that the executor can reach the point of issuing
     * requests at all. Called once on the prototype before dispatch.
     * @return false if the run cannot start.
     */
    virtual bool prepare() const { return true; }

    /**
     * @brief Starts a single attempt (e.g., one HTTP request).
     *
     * At most one attempt per executor is outstanding. The handler is called
     * exactly once with the classified outcome, from a thread running the
     * io_context, and never from inside async_execute() itself.
     */
    virtual void async_execute(OutcomeHandler handler) = 0;

    /**
     * @brief Creates an independent copy for another slot.
     * @param ioc The io_context that will drive the copy's I/O.
     * @return A std::unique_ptr to the new IRequestExecutor instance.
     */
    virtual std::unique_ptr<IRequestExecutor> clone(boost::asio::io_context& ioc) const = 0;
};
