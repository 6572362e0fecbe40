#pragma once

#include "zones/text_zone.h"
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief Lifecycle of one page's result slot
 */
enum class SlotState {
    Unclaimed,   // not yet started
    Claimed,     // taken by a worker, or pre-claimed by cancellation
    Success,     // text extracted
    NoImage,     // nothing to recognise (or skipped under the resume policy)
    Failed,      // unrecoverable error
};

const char* SlotStateName(SlotState state);

/**
 * @brief Snapshot of a result slot
 */
struct PageOutcome {
    SlotState state = SlotState::Unclaimed;
    std::shared_ptr<const TextZone> zone;   // Success only
    std::string errorMessage;               // Failed only
    bool interrupted = false;               // Failed because of a user interrupt
    bool preClaimed = false;                // claimed by cancellation, never processed

    bool IsTerminal() const {
        return state == SlotState::Success || state == SlotState::NoImage ||
               state == SlotState::Failed;
    }

    static PageOutcome Success(std::shared_ptr<const TextZone> zone);
    static PageOutcome NoImage();
    static PageOutcome Failed(std::string message, bool interrupted = false);
};

/**
 * @brief Per-page result slots shared by the workers and the assembler
 *
 * One mutex and one condition variable guard every transition. The lock is
 * never held while a page is processed.
 */
class ResultStore {
public:
    explicit ResultStore(size_t size);

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;

    size_t size() const { return slots_.size(); }

    /**
     * @brief Atomically move a slot from Unclaimed to Claimed
     * @return true if the caller now owns the page
     */
    bool TryClaim(size_t index);

    /**
     * @brief Record the terminal outcome of a claimed page and wake waiters
     * @throws std::logic_error if the slot was not claimed by a worker, or if
     *         the outcome is not terminal
     */
    void Complete(size_t index, PageOutcome outcome);

    /**
     * @brief Block until the slot is terminal, pre-claimed by cancellation,
     *        or the run is interrupted
     */
    PageOutcome AwaitTerminal(size_t index);

    /**
     * @brief Pre-claim every Unclaimed slot at or after fromIndex
     * @return number of slots pre-claimed by this call
     */
    size_t CancelRemaining(size_t fromIndex);

    /// Cancel everything and release a blocked AwaitTerminal()
    void Interrupt();

    bool IsCancelled() const;
    bool IsInterrupted() const;

    /// Current state of a slot
    PageOutcome Get(size_t index) const;

private:
    void CheckIndex(size_t index) const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<PageOutcome> slots_;
    bool cancelled_ = false;
    bool interrupted_ = false;
};

} // namespace ocrlayer
