#pragma once

#include "cli/Router.hpp"
#include "upload/Workflow.hpp"

#include <cstdint>
#include <map>
#include <optional>

namespace cw::cli {

void registerCommands(Router& router);

CommandResult handleUpload(const CommandCall& call);
CommandResult handlePlan(const CommandCall& call);
CommandResult handleConfig(const CommandCall& call);

// Builds the workflow input from command-line options. Throws std::invalid_argument on bad input.
upload::UploadRequest buildUploadRequest(const CommandCall& call);

// The first failed stage, in workflow order.
std::optional<upload::Stage> firstFailedStage(const upload::WorkflowStatus& status);

struct RecoveryStep {
    enum class Action : uint8_t { RETRY, SKIP, STOP };

    Action action = Action::STOP;
    upload::Stage stage = upload::Stage::ASSET_CREATION;
};

// What `upload` does when the workflow pauses. Every stage gets its own retry budget;
// once a stage has used it, the stage is skipped (--skip-failed) or the command stops.
// Asset creation is never skipped.
class RecoveryPolicy {
public:
    RecoveryPolicy(unsigned int retriesPerStage, bool skipFailed);

    [[nodiscard]] RecoveryStep next(const upload::WorkflowStatus& status);

private:
    unsigned int retriesPerStage_;
    bool skipFailed_;
    std::map<upload::Stage, unsigned int> retriesUsed_;
};

}
