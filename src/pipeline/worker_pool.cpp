#include "pipeline/worker_pool.h"
#include "common/errors.h"
#include "common/logger.hpp"
#include "common/subprocess.h"

#include <stdexcept>

namespace ocrlayer {

ErrorPolicy ParseErrorPolicy(const std::string& name) {
    if (name == "abort") return ErrorPolicy::Abort;
    if (name == "resume") return ErrorPolicy::Resume;
    throw std::invalid_argument("error policy must be one of: abort, resume");
}

const char* ErrorPolicyName(ErrorPolicy policy) {
    return policy == ErrorPolicy::Abort ? "abort" : "resume";
}

WorkerPool::WorkerPool(ResultStore& store, const std::vector<PageDescriptor>& pages,
                       PageProcessor processor, ErrorPolicy policy, int numWorkers)
    : store_(store), pages_(pages), processor_(std::move(processor)), policy_(policy),
      numWorkers_(numWorkers > 0 ? numWorkers : DefaultWorkerCount()) {
    if (pages_.size() != store_.size()) {
        throw std::invalid_argument("page list and result store sizes differ");
    }
}

WorkerPool::~WorkerPool() {
    Join();
}

int WorkerPool::DefaultWorkerCount() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
}

void WorkerPool::Start() {
    if (!workers_.empty()) {
        LOG_WARN("Worker pool already started");
        return;
    }
    workers_.reserve(numWorkers_);
    for (int i = 0; i < numWorkers_; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerLoop, this, i);
    }
    LOG_DEBUG("Started {} worker thread(s) for {} page(s)", numWorkers_, pages_.size());
}

void WorkerPool::Join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void WorkerPool::WorkerLoop(int workerId) {
    for (const auto& page : pages_) {
        if (store_.IsInterrupted()) {
            break;
        }
        if (!store_.TryClaim(page.index)) {
            continue;
        }
        LOG_TRACE("Worker {} claimed page {}", workerId, page.pageNumber());
        if (!ProcessPage(page)) {
            break;
        }
    }
    LOG_TRACE("Worker {} finished", workerId);
}

bool WorkerPool::ProcessPage(const PageDescriptor& page) {
    const size_t index = static_cast<size_t>(page.index);
    std::string failure;

    try {
        auto zone = processor_(page);
        store_.Complete(index, zone ? PageOutcome::Success(std::move(zone)) : PageOutcome::NoImage());
        return true;
    } catch (const NoImageError& e) {
        LOG_INFO("Page {}: {}", page.pageNumber(), e.what());
        store_.Complete(index, PageOutcome::NoImage());
        return true;
    } catch (const CalledProcessInterrupted& e) {
        if (e.byUser()) {
            store_.Complete(index, PageOutcome::Failed(e.what(), true));
            return false;
        }
        failure = e.what();
    } catch (const InterruptedError& e) {
        store_.Complete(index, PageOutcome::Failed(e.what(), true));
        return false;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    LOG_ERROR("Exception while processing page {}: {}", page.pageNumber(), failure);
    if (policy_ == ErrorPolicy::Resume) {
        store_.Complete(index, PageOutcome::NoImage());
        return true;
    }
    store_.Complete(index, PageOutcome::Failed(failure));
    return false;
}

} // namespace ocrlayer
