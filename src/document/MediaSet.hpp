#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace document
{

struct MediaResource
{
    std::string name;
    std::string content_type;
    std::vector<std::uint8_t> data;
};

// Embedded media of a document, ordered and deduplicated by name.
// Documents hold it through std::shared_ptr<const MediaSet>; a translated
// document shares the set of its source.
class MediaSet
{
public:
    // Returns the index of the resource. A name that is already present keeps
    // its first resource.
    std::size_t add(MediaResource resource);

    const MediaResource* find(const std::string& name) const;
    bool contains(const std::string& name) const { return index_.count(name) != 0; }

    std::size_t size() const { return resources_.size(); }
    bool empty() const { return resources_.empty(); }
    const std::vector<MediaResource>& resources() const { return resources_; }

private:
    std::vector<MediaResource> resources_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace document
