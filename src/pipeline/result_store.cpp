#include "pipeline/result_store.h"
#include "common/logger.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace ocrlayer {

const char* SlotStateName(SlotState state) {
    switch (state) {
        case SlotState::Unclaimed: return "unclaimed";
        case SlotState::Claimed:   return "claimed";
        case SlotState::Success:   return "success";
        case SlotState::NoImage:   return "no-image";
        case SlotState::Failed:    return "failed";
    }
    return "unknown";
}

// ==================== PageOutcome ====================

PageOutcome PageOutcome::Success(std::shared_ptr<const TextZone> zone) {
    PageOutcome outcome;
    outcome.state = SlotState::Success;
    outcome.zone = std::move(zone);
    return outcome;
}

PageOutcome PageOutcome::NoImage() {
    PageOutcome outcome;
    outcome.state = SlotState::NoImage;
    return outcome;
}

PageOutcome PageOutcome::Failed(std::string message, bool interrupted) {
    PageOutcome outcome;
    outcome.state = SlotState::Failed;
    outcome.errorMessage = std::move(message);
    outcome.interrupted = interrupted;
    return outcome;
}

// ==================== ResultStore ====================

ResultStore::ResultStore(size_t size) : slots_(size) {}

void ResultStore::CheckIndex(size_t index) const {
    if (index >= slots_.size()) {
        throw std::out_of_range(fmt::format("page index {} out of range [0, {})", index, slots_.size()));
    }
}

bool ResultStore::TryClaim(size_t index) {
    CheckIndex(index);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[index];
    if (slot.state != SlotState::Unclaimed) {
        return false;
    }
    slot.state = SlotState::Claimed;
    return true;
}

void ResultStore::Complete(size_t index, PageOutcome outcome) {
    CheckIndex(index);
    if (!outcome.IsTerminal()) {
        throw std::logic_error(fmt::format("page index {}: {} is not a terminal state",
                                           index, SlotStateName(outcome.state)));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = slots_[index];
        if (slot.state != SlotState::Claimed || slot.preClaimed) {
            throw std::logic_error(fmt::format("page index {} completed while {}{}", index,
                                               SlotStateName(slot.state),
                                               slot.preClaimed ? " (cancelled)" : ""));
        }
        outcome.preClaimed = false;
        slot = std::move(outcome);
    }
    cv_.notify_all();
}

PageOutcome ResultStore::AwaitTerminal(size_t index) {
    CheckIndex(index);
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, index]() {
        const auto& slot = slots_[index];
        return slot.IsTerminal() || slot.preClaimed || interrupted_;
    });
    return slots_[index];
}

size_t ResultStore::CancelRemaining(size_t fromIndex) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        for (size_t i = fromIndex; i < slots_.size(); ++i) {
            auto& slot = slots_[i];
            if (slot.state == SlotState::Unclaimed) {
                slot.state = SlotState::Claimed;
                slot.preClaimed = true;
                ++count;
            }
        }
    }
    cv_.notify_all();
    return count;
}

void ResultStore::Interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    CancelRemaining(0);
}

bool ResultStore::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool ResultStore::IsInterrupted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupted_;
}

PageOutcome ResultStore::Get(size_t index) const {
    CheckIndex(index);
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[index];
}

} // namespace ocrlayer
