#ifndef CMDQ_PIPELINE_HPP
#define CMDQ_PIPELINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "context.hpp"
#include "metadata.hpp"
#include "output.hpp"
#include "registry.hpp"
#include "worker_pool.hpp"

namespace cmdq {

// Runs `a | b | c` strictly in order: each stage starts only after the
// previous one has finished, and a stage's non-empty return value is appended
// as the last argument of the next stage. The final stage reports to the
// pipeline's callback; an unmatched stage reports Unhandled and a failing
// intermediate stage reports its Failure, ending the pipeline either way.
class PipelineExecutor {
public:
    PipelineExecutor(std::vector<std::string> stages,
                     std::shared_ptr<const Registry> registry,
                     std::shared_ptr<const MetadataTable> metadata,
                     WorkerPool& pool,
                     Context context,
                     ResultCallback callback);

    // Blocks the calling thread while intermediate stages run.
    void run();

private:
    // Sets `delivered` once the callback has fired or been handed to the
    // final stage; run() reports anything thrown before that as Failure.
    void runStages(bool& delivered);

    std::vector<std::string> stages_;
    std::shared_ptr<const Registry> registry_;
    std::shared_ptr<const MetadataTable> metadata_;
    WorkerPool& pool_;
    Context context_;
    ResultCallback callback_;
};

} // namespace cmdq

#endif // CMDQ_PIPELINE_HPP
