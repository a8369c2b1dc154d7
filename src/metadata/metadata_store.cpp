#include <geotagger/metadata/metadata_store.hpp>

#include <spdlog/spdlog.h>

namespace geotagger
{

bool MetadataStore::commit(WorkItem &item)
{
    if (!item.isDirty())
    {
        return true;
    }

    if (!write(item.identity(), item.metadata()))
    {
        spdlog::warn("Unable to commit metadata for {}", item.identity());
        return false;
    }

    item.markClean();
    return true;
}

void InMemoryMetadataStore::put(const std::string &identity, TagMap tags)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _tags[identity] = std::move(tags);
}

std::optional<TagMap> InMemoryMetadataStore::read(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto iter = _tags.find(identity);
    if (iter == _tags.end())
    {
        return std::nullopt;
    }
    return iter->second;
}

size_t InMemoryMetadataStore::writeCount() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _write_count;
}

bool InMemoryMetadataStore::write(const std::string &identity, const TagMap &tags)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _tags[identity] = tags;
    _write_count++;
    return true;
}

} // namespace geotagger
