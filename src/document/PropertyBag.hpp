#pragma once

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace document
{

// Opaque formatting blob (paragraph, run, table, grid or cell properties).
// The translator never looks inside; it only carries handles across.
class PropertyBag
{
public:
    PropertyBag() = default;
    PropertyBag(std::initializer_list<std::pair<const std::string, std::string>> values)
        : values_(values)
    {
    }

    void set(const std::string& key, std::string value) { values_[key] = std::move(value); }

    std::optional<std::string> get(const std::string& key) const
    {
        auto it = values_.find(key);
        if (it == values_.end())
            return std::nullopt;
        return it->second;
    }

    bool empty() const { return values_.empty(); }
    std::size_t size() const { return values_.size(); }
    const std::map<std::string, std::string>& values() const { return values_; }

    bool operator==(const PropertyBag&) const = default;

private:
    std::map<std::string, std::string> values_;
};

using PropertiesPtr = std::shared_ptr<const PropertyBag>;

inline PropertiesPtr makeProperties(std::initializer_list<std::pair<const std::string, std::string>> values = {})
{
    return std::make_shared<const PropertyBag>(values);
}

// Value equality; two null handles are equal.
inline bool propertiesEqual(const PropertiesPtr& a, const PropertiesPtr& b)
{
    if (a == b)
        return true;
    if (!a || !b)
        return false;
    return *a == *b;
}

} // namespace document
