#ifndef SIMPILOT_MCP_WORKERS_HPP
#define SIMPILOT_MCP_WORKERS_HPP

// Threads serving long-running tool calls. Finished workers are joined on
// the next launch or reap, so the set only holds calls still in flight.

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace mcp_workers {

class WorkerSet {
public:
    WorkerSet() = default;
    ~WorkerSet();

    WorkerSet(const WorkerSet &) = delete;
    WorkerSet &operator=(const WorkerSet &) = delete;

    // Joins finished workers, then starts job on a new thread.
    void launch(std::function<void()> job);

    // Joins every worker whose job has returned. Returns how many were joined.
    size_t reap_finished();

    // Blocks until every worker has returned.
    void join_all();

    size_t size() const { return workers_.size(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::vector<Worker> workers_;
};

} // namespace mcp_workers

#endif // SIMPILOT_MCP_WORKERS_HPP
