#include "pipeline/cancellation.h"
#include "common/logger.hpp"

namespace ocrlayer {

size_t CancellationController::CancelRemaining(size_t fromIndex) {
    size_t withdrawn = store_.CancelRemaining(fromIndex);
    if (withdrawn > 0) {
        LOG_DEBUG("Cancelled {} pending page(s) from index {}", withdrawn, fromIndex);
    }
    return withdrawn;
}

void CancellationController::Interrupt() {
    if (!store_.IsInterrupted()) {
        LOG_WARN("Interrupted, waiting for pages in progress to finish...");
    }
    store_.Interrupt();
}

} // namespace ocrlayer
