#pragma once
#include <filesystem>
#include <string>

namespace Folio {
namespace Cluster {

struct DownloadTask {
    std::string           page_id;
    std::string           url;
    std::string           title;
    std::filesystem::path save_path;  // absolute, fixed before execution starts
    int                   attempts = 0;
};

}  // namespace Cluster
}  // namespace Folio
