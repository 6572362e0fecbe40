#pragma once

#include "document/page_source.h"
#include "pipeline/result_store.h"
#include "zones/text_zone.h"
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ocrlayer {

/**
 * @brief What a worker does when a page fails
 */
enum class ErrorPolicy {
    Abort,    // record Failed and stop this worker
    Resume,   // record NoImage and go on with the next page
};

/// Parse "abort" or "resume"; throws std::invalid_argument
ErrorPolicy ParseErrorPolicy(const std::string& name);
const char* ErrorPolicyName(ErrorPolicy policy);

/**
 * @brief Per-page work: render, recognise, extract
 *
 * Returns the page's zone tree; nullptr or NoImageError means the page has
 * nothing to recognise.
 */
using PageProcessor = std::function<std::shared_ptr<const TextZone>(const PageDescriptor&)>;

/**
 * @brief Fixed set of threads racing over the ordered page list
 *
 * Every worker walks the whole list and processes the pages it manages to
 * claim, so each page is processed at most once whatever the thread count.
 */
class WorkerPool {
public:
    WorkerPool(ResultStore& store, const std::vector<PageDescriptor>& pages,
               PageProcessor processor, ErrorPolicy policy, int numWorkers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void Start();

    /// Wait for every worker to return; safe to call more than once
    void Join();

    int size() const { return numWorkers_; }

    /// Number of processing units, at least 1
    static int DefaultWorkerCount();

private:
    void WorkerLoop(int workerId);

    /// @return false if the worker must stop
    bool ProcessPage(const PageDescriptor& page);

    ResultStore& store_;
    const std::vector<PageDescriptor>& pages_;
    PageProcessor processor_;
    ErrorPolicy policy_;
    int numWorkers_;
    std::vector<std::thread> workers_;
};

} // namespace ocrlayer
