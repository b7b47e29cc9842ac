#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace Folio {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Relative keys live under the storage root; absolute keys must stay inside it.
    virtual bool                       save(const std::filesystem::path& key,
                                            const std::string&           content) = 0;
    virtual std::optional<std::string> load(const std::filesystem::path& key) const = 0;
};

}  // namespace Storage
}  // namespace Folio
