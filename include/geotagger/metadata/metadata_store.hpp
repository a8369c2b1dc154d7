#pragma once

#include <geotagger/types/work_item.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace geotagger
{

class MetadataStore
{
  public:
    virtual ~MetadataStore() = default;

    // std::nullopt when the identity is unknown or unreadable
    virtual std::optional<TagMap> read(const std::string &identity) = 0;

    // persists the item's tags if it is dirty and clears the flag, returns false on failure
    bool commit(WorkItem &item);

  protected:
    virtual bool write(const std::string &identity, const TagMap &tags) = 0;
};

// keeps everything in memory, used for dry runs and tests
class InMemoryMetadataStore final : public MetadataStore
{
  public:
    void put(const std::string &identity, TagMap tags);

    std::optional<TagMap> read(const std::string &identity) override;

    size_t writeCount() const;

  protected:
    bool write(const std::string &identity, const TagMap &tags) override;

  private:
    mutable std::mutex _mutex;
    std::unordered_map<std::string, TagMap> _tags;
    size_t _write_count = 0;
};

} // namespace geotagger
