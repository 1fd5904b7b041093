#pragma once

#include "chronicle/timeline/Processor.hh"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronicle {

struct PipelineRun {
    DependencyOutputs outputs;
    std::vector<std::string> executed;
    std::vector<std::string> skipped;
};

/**
 * @brief Ordered registry of processors.
 *
 * Registration order is the execution order. A processor may only depend
 * on processors registered before it, so the order is a topological order
 * of the dependency graph by construction and cycles cannot be registered.
 */
class TimelinePipeline {
  public:
    TimelinePipeline() = default;
    TimelinePipeline(TimelinePipeline&&) = default;
    TimelinePipeline& operator=(TimelinePipeline&&) = default;

    // Throws ChronicleException on an empty or duplicate id, or on a
    // dependency that is not registered yet.
    void registerProcessor(std::unique_ptr<Processor> processor);

    std::vector<std::string> order() const;
    size_t size() const { return processors_.size(); }
    const Processor* find(const std::string& id) const;

    // Runs every processor whose dependencies produced output, in order.
    // Touched entities are flushed after each stage. Exceptions propagate.
    PipelineRun run(const SnapshotContext& snapshot, Store& store, IdentityMap& entities,
                    std::vector<PipelineWarning>& warnings) const;

  private:
    std::vector<std::unique_ptr<Processor>> processors_;
    std::unordered_map<std::string, std::vector<std::string>> dependencies_;
};

} // namespace chronicle
