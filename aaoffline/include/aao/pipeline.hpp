#pragma once

#include <string>
#include <vector>
#include "aao/config.hpp"
#include "aao/http_client.hpp"
#include "aao/models.hpp"

namespace aao {

// Overall status from the per-case outcomes and sequence errors.
RunStatus summarizeRun(const RunReport& report, bool cancelled);

// Human-readable summary printed at the end of a run.
std::string formatReport(const RunReport& report);

// One invocation: resolve, plan, fetch, rewrite, link and write every case.
// The transport is injected so tests can run without a network.
class Pipeline {
public:
    Pipeline(Config cfg, Transport transport);

    RunReport run(const std::vector<std::string>& inputs, CancelToken& cancel);

private:
    Config cfg_;
    Transport transport_;
};

} // namespace aao
