#pragma once

#include "pipeline/result_store.h"
#include <cstddef>

namespace ocrlayer {

/**
 * @brief Cooperative shutdown of a document run
 *
 * Cancellation never preempts a page in flight: it pre-claims the pages no
 * worker has started, so the workers run out of work and return.
 */
class CancellationController {
public:
    explicit CancellationController(ResultStore& store) : store_(store) {}

    /**
     * @brief Stop dispatching pages at or after fromIndex; idempotent
     * @return number of pages withdrawn by this call
     */
    size_t CancelRemaining(size_t fromIndex);

    /// User interrupt: cancel everything and wake the assembler
    void Interrupt();

    bool cancelled() const { return store_.IsCancelled(); }
    bool interrupted() const { return store_.IsInterrupted(); }

private:
    ResultStore& store_;
};

} // namespace ocrlayer
