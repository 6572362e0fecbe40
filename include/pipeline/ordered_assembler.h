#pragma once

#include "document/page_source.h"
#include "pipeline/cancellation.h"
#include "pipeline/result_store.h"
#include "pipeline/transcript.h"
#include "pipeline/worker_pool.h"
#include <vector>

namespace ocrlayer {

/**
 * @brief Counters of a completed drain
 */
struct AssemblyStats {
    int pagesWritten = 0;
    int pagesWithText = 0;
    int pagesWithoutText = 0;
};

/**
 * @brief Single consumer that turns out-of-order results into an ordered
 *        transcript
 *
 * Runs on the coordinating thread while the worker pool is active.
 */
class OrderedAssembler {
public:
    OrderedAssembler(ResultStore& store, CancellationController& cancellation,
                     WorkerPool& workers, const std::vector<PageDescriptor>& pages,
                     Transcript& transcript);

    /**
     * @brief Wait for every page in index order and append it to the transcript
     *
     * On a failed page (or an interrupt) the remaining pages are cancelled
     * and the workers joined before the error is raised; the entries
     * written so far stay in the transcript.
     *
     * @throws PipelineAbortedError if a page failed under the abort policy
     * @throws InterruptedError if the run was interrupted
     */
    AssemblyStats Drain();

private:
    void Halt(size_t fromIndex);

    ResultStore& store_;
    CancellationController& cancellation_;
    WorkerPool& workers_;
    const std::vector<PageDescriptor>& pages_;
    Transcript& transcript_;
};

} // namespace ocrlayer
