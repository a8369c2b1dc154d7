#pragma once

#include <geotagger/types/metadata_value.hpp>
#include <geotagger/types/position.hpp>

#include <map>
#include <optional>
#include <string>

namespace geotagger
{

using TagMap = std::map<std::string, MetadataValue>;

class WorkItem
{
  public:
    WorkItem() = default;
    explicit WorkItem(std::string identity, TagMap metadata = {});

    WorkItem(WorkItem &&) = default;
    WorkItem &operator=(WorkItem &&) = default;

    // items move through the pipeline, never copied between stages
    WorkItem(const WorkItem &) = delete;
    WorkItem &operator=(const WorkItem &) = delete;

    const std::string &identity() const
    {
        return _identity;
    }

    bool contains(const std::string &tag) const;

    // throws std::runtime_error if the tag is missing
    const MetadataValue &get(const std::string &tag) const;

    // throws std::runtime_error if the tag is missing or holds another shape
    template <typename T> const T &getAs(const std::string &tag) const
    {
        const MetadataValue &value = get(tag);
        const T *typed = std::get_if<T>(&value);
        if (typed == nullptr)
        {
            throwWrongShape(tag, value);
        }
        return *typed;
    }

    void set(const std::string &tag, MetadataValue value);
    void erase(const std::string &tag);

    const TagMap &metadata() const
    {
        return _metadata;
    }

    bool isDirty() const
    {
        return _dirty;
    }
    void markClean()
    {
        _dirty = false;
    }

    std::optional<Position> position;

    // output fields keyed by result column name
    std::map<std::string, std::string> result;

  private:
    [[noreturn]] void throwWrongShape(const std::string &tag, const MetadataValue &value) const;

    std::string _identity;
    TagMap _metadata;
    bool _dirty = false;
};

} // namespace geotagger
