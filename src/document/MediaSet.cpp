#include "MediaSet.hpp"

namespace document
{

std::size_t MediaSet::add(MediaResource resource)
{
    auto it = index_.find(resource.name);
    if (it != index_.end())
        return it->second;

    const std::size_t idx = resources_.size();
    index_.emplace(resource.name, idx);
    resources_.push_back(std::move(resource));
    return idx;
}

const MediaResource* MediaSet::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &resources_[it->second];
}

} // namespace document
