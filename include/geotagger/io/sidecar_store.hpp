#pragma once

#include <geotagger/metadata/metadata_store.hpp>

#include <optional>
#include <string>

namespace geotagger
{

bool toJson(const TagMap &tags, std::string &json);
bool fromJson(const std::string &json, TagMap &tags);

/*
 * Stores each photo's tags in a JSON file next to it, "<photo><suffix>".
 * A photo without a sidecar reads as having no tags, a missing photo is unreadable.
 */
class SidecarMetadataStore final : public MetadataStore
{
  public:
    explicit SidecarMetadataStore(std::string suffix = ".json");

    std::optional<TagMap> read(const std::string &identity) override;

    std::string sidecarPath(const std::string &identity) const;

  protected:
    bool write(const std::string &identity, const TagMap &tags) override;

  private:
    std::string _suffix;
};

} // namespace geotagger
