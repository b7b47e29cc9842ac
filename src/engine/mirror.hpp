#pragma once
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../blocks/block_id_mapper.hpp"
#include "../cluster/execution_report.hpp"
#include "../core/config/config.hpp"
#include "../core/logger/logger.hpp"
#include "../core/types/cookie.hpp"
#include "../graph/page_graph.hpp"

class MirrorTest_ConfirmPrompt_Test;
class MirrorTest_WorkerCommand_Test;

namespace Folio {
namespace Engine {

enum MirrorExit {
    MIRROR_OK         = 0,
    MIRROR_ERROR      = 1,
    MIRROR_INCOMPLETE = 2
};

// Discovery, confirmation, parallel download and link rewriting of one site.
class Mirror {
#ifndef CPPCHECK
    friend class ::MirrorTest_ConfirmPrompt_Test;
    friend class ::MirrorTest_WorkerCommand_Test;
#endif

public:
    Mirror(Core::Config config, Core::LoggerPtr logger, std::istream& input = std::cin);

    int run();

private:
    Graph::PageGraph discover();
    bool             confirm(const std::string& question);

    std::vector<std::string> worker_command() const;
    Blocks::BlockMapCache    load_block_maps(const Graph::PageGraph&        graph,
                                             const Cluster::ExecutionReport& report) const;

    Core::Config              config_;
    Core::LoggerPtr           logger_;
    std::istream&             input_;
    std::filesystem::path     output_root_;
    std::vector<Core::Cookie> cookies_;
};

}  // namespace Engine
}  // namespace Folio
