#include "pipeline/ordered_assembler.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <stdexcept>
#include <string>

namespace ocrlayer {

OrderedAssembler::OrderedAssembler(ResultStore& store, CancellationController& cancellation,
                                   WorkerPool& workers, const std::vector<PageDescriptor>& pages,
                                   Transcript& transcript)
    : store_(store), cancellation_(cancellation), workers_(workers), pages_(pages),
      transcript_(transcript) {}

void OrderedAssembler::Halt(size_t fromIndex) {
    cancellation_.CancelRemaining(fromIndex);
    if (workers_.size() > 1) {
        LOG_INFO("Waiting for other threads to finish...");
    }
    workers_.Join();
}

AssemblyStats OrderedAssembler::Drain() {
    AssemblyStats stats;

    for (const auto& page : pages_) {
        const size_t index = static_cast<size_t>(page.index);
        PageOutcome outcome = store_.AwaitTerminal(index);

        if (store_.IsInterrupted() || outcome.interrupted || outcome.preClaimed) {
            Halt(index);
            throw InterruptedError();
        }

        switch (outcome.state) {
            case SlotState::Success:
                LOG_INFO("- Page #{}", page.pageNumber());
                transcript_.Append(page, outcome.zone);
                ++stats.pagesWithText;
                break;
            case SlotState::NoImage:
                LOG_INFO("- Page #{} (no text)", page.pageNumber());
                transcript_.Append(page, nullptr);
                ++stats.pagesWithoutText;
                break;
            case SlotState::Failed:
                Halt(index);
                throw PipelineAbortedError(page.pageNumber(), outcome.errorMessage);
            default:
                Halt(index);
                throw std::logic_error("page " + std::to_string(page.pageNumber()) +
                                       " returned while " + SlotStateName(outcome.state));
        }
        ++stats.pagesWritten;
    }

    workers_.Join();
    return stats;
}

} // namespace ocrlayer
