#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace Folio {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_DEPTH      = 10;
    static constexpr int         DEFAULT_WORKERS    = 4;
    static constexpr const char* DEFAULT_OUTPUT_DIR = "mirror";
    static constexpr const char* VERSION            = "0.1.0";

    static constexpr int DEFAULT_MAX_RETRIES       = 3;
    static constexpr int DEFAULT_RETRY_DELAY_MS    = 1500;
    static constexpr int DEFAULT_TASK_TIMEOUT_MS   = 120000;
    static constexpr int DEFAULT_PAGE_TIMEOUT_MS   = 60000;
    static constexpr int DEFAULT_SETTLE_MS         = 1500;
    static constexpr int DEFAULT_SHUTDOWN_GRACE_MS = 1000;
    static constexpr int DEFAULT_INIT_TIMEOUT_MS   = 60000;
    static constexpr int DEFAULT_CDP_PORT          = 9222;
    static constexpr int MAX_BACKOFF_EXPONENT      = 20;
    static constexpr int MAX_BACKOFF_MS            = 5 * 60 * 1000;

    static constexpr const char* INDEX_FILENAME   = "index.html";
    static constexpr const char* SIDECAR_FILENAME = ".block-ids.json";
    static constexpr const char* GRAPH_FILENAME   = ".site-graph.json";
    static constexpr const char* UNTITLED         = "untitled";

    static constexpr size_t MAX_SEGMENT_LENGTH    = 150;
    static constexpr size_t TRUNCATED_SEGMENT_LEN = 140;
    static constexpr size_t RAW_BLOCK_ID_LENGTH   = 32;

    static constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;
    static constexpr int      IPC_CHILD_IN_FD  = 3;
    static constexpr int      IPC_CHILD_OUT_FD = 4;
};

inline std::chrono::milliseconds get_backoff_time(int attempt,
                                                  std::chrono::milliseconds base
                                                  = std::chrono::milliseconds(1000)) {
    if (attempt <= 0 || base.count() <= 0)
        return std::chrono::milliseconds(0);
    int64_t factor = int64_t(1) << std::min(attempt - 1, Constants::MAX_BACKOFF_EXPONENT);
    int64_t delay  = std::min<int64_t>(static_cast<int64_t>(base.count()) * factor,
                                      Constants::MAX_BACKOFF_MS);
    return std::chrono::milliseconds(delay);
}

}  // namespace Core
}  // namespace Folio
