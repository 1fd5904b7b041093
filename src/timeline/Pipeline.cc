#include "chronicle/timeline/Pipeline.hh"

#include "chronicle/core/Log.hh"

#include <algorithm>

namespace chronicle {

std::string_view warningKindToString(WarningKind kind) {
    switch (kind) {
    case WarningKind::MissingDependency:
        return "MissingDependency";
    case WarningKind::AmbiguousSubject:
        return "AmbiguousSubject";
    }
    return "Unknown";
}

void ProcessorInput::ambiguous(const std::string& message) {
    warnings.push_back(PipelineWarning{WarningKind::AmbiguousSubject, processorId, message});
    CHRONICLE_TIMELINE_LOG_DEBUG("{} {} [{}] {}", snapshot.seriesName, daysToDate(snapshot.day), processorId, message);
}

void TimelinePipeline::registerProcessor(std::unique_ptr<Processor> processor) {
    if (!processor) {
        throwError("Processor cannot be null");
    }

    std::string id = processor->id();
    if (id.empty()) {
        throwError("Processor id cannot be empty");
    }
    if (dependencies_.find(id) != dependencies_.end()) {
        throwError("Processor '" + id + "' is already registered");
    }

    auto deps = processor->dependencies();
    for (const auto& dep : deps) {
        if (dep == id) {
            throwError("Processor '" + id + "' depends on itself");
        }
        if (dependencies_.find(dep) == dependencies_.end()) {
            throwError("Processor '" + id + "' depends on '" + dep + "', which is not registered before it");
        }
    }

    dependencies_.emplace(id, std::move(deps));
    processors_.push_back(std::move(processor));
    CHRONICLE_TIMELINE_LOG_DEBUG("Registered processor '{}'", id);
}

std::vector<std::string> TimelinePipeline::order() const {
    std::vector<std::string> ids;
    ids.reserve(processors_.size());
    for (const auto& processor : processors_) {
        ids.push_back(processor->id());
    }
    return ids;
}

const Processor* TimelinePipeline::find(const std::string& id) const {
    auto it = std::find_if(processors_.begin(), processors_.end(),
                           [&id](const std::unique_ptr<Processor>& p) { return p->id() == id; });
    return it == processors_.end() ? nullptr : it->get();
}

PipelineRun TimelinePipeline::run(const SnapshotContext& snapshot, Store& store, IdentityMap& entities,
                                  std::vector<PipelineWarning>& warnings) const {
    PipelineRun result;
    std::string prefix = snapshot.seriesName + " " + daysToDate(snapshot.day);

    for (const auto& processor : processors_) {
        std::string id = processor->id();

        const auto& deps = dependencies_.at(id);
        auto missing = std::find_if(deps.begin(), deps.end(),
                                    [&result](const std::string& dep) { return !result.outputs.contains(dep); });
        if (missing != deps.end()) {
            std::string message = "dependency '" + *missing + "' produced no output";
            warnings.push_back(PipelineWarning{WarningKind::MissingDependency, id, message});
            CHRONICLE_TIMELINE_LOG_WARN("{} skipping '{}': {}", prefix, id, message);
            result.skipped.push_back(id);
            continue;
        }

        ProcessorInput input{snapshot, result.outputs, store, entities, warnings, id};
        CHRONICLE_TIMELINE_LOG_DEBUG("{} running '{}'", prefix, id);
        std::any output = processor->run(input);
        entities.flush();

        if (output.has_value()) {
            result.outputs.set(id, std::move(output));
        }
        result.executed.push_back(id);
    }
    return result;
}

} // namespace chronicle
