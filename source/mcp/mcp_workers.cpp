#include "mcp/mcp_workers.hpp"

#include <utility>

namespace mcp_workers {

WorkerSet::~WorkerSet() {
    join_all();
}

void WorkerSet::launch(std::function<void()> job) {
    reap_finished();

    Worker worker;
    worker.finished = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> finished = worker.finished;
    worker.thread = std::thread([job = std::move(job), finished]() {
        job();
        finished->store(true);
    });
    workers_.push_back(std::move(worker));
}

size_t WorkerSet::reap_finished() {
    size_t joined = 0;
    auto worker = workers_.begin();
    while (worker != workers_.end()) {
        if (!worker->finished->load()) {
            ++worker;
            continue;
        }
        worker->thread.join();
        worker = workers_.erase(worker);
        joined++;
    }
    return joined;
}

void WorkerSet::join_all() {
    for (auto &worker : workers_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    workers_.clear();
}

} // namespace mcp_workers
