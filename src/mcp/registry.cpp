#include <mcp_bridge/mcp/registry.hpp>

#include <mcp_bridge/core/log.hpp>

#include <algorithm>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "registry";

std::string Capitalized(ItemCategory category) {
    std::string name = CategoryName(category);
    name[0] = static_cast<char>(name[0] - 'a' + 'A');
    return name;
}

Error MakeNotFound(ItemCategory category, const std::string& name) {
    return Error{"Registry",
                 Capitalized(category) + " with name '" + name + "' not found",
                 ErrorCategory::NotFound};
}

auto FindByName(const std::vector<ItemPtr>& items, const std::string& name) {
    return std::find_if(items.begin(), items.end(),
                        [&](const ItemPtr& item) { return item->Name() == name; });
}

} // anonymous namespace

std::vector<ItemPtr>& Registry::Bucket(ItemCategory category) {
    switch (category) {
        case ItemCategory::Tool:     return tools_;
        case ItemCategory::Resource: return resources_;
        case ItemCategory::Prompt:   return prompts_;
    }
    return tools_;
}

const std::vector<ItemPtr>& Registry::Bucket(ItemCategory category) const {
    switch (category) {
        case ItemCategory::Tool:     return tools_;
        case ItemCategory::Resource: return resources_;
        case ItemCategory::Prompt:   return prompts_;
    }
    return tools_;
}

Result<void, Error> Registry::Register(Item item) {
    const auto category = item.Category();
    const auto name = item.Name();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& bucket = Bucket(category);
        if (FindByName(bucket, name) != bucket.end()) {
            return Result<void, Error>::Err(Error{
                "Registry",
                Capitalized(category) + " with name '" + name + "' already registered",
                ErrorCategory::DuplicateName});
        }
        bucket.push_back(std::make_shared<const Item>(std::move(item)));
    }
    LogDebug(kComponent, Capitalized(category) + " registered: " + name);
    return Result<void, Error>::Ok();
}

Result<ItemPtr, Error> Registry::Unregister(ItemCategory category,
                                            const std::string& name) {
    ItemPtr removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& bucket = Bucket(category);
        auto it = FindByName(bucket, name);
        if (it == bucket.end()) {
            return Result<ItemPtr, Error>::Err(MakeNotFound(category, name));
        }
        removed = *it;
        bucket.erase(it);
    }
    LogDebug(kComponent, Capitalized(category) + " unregistered: " + name);
    return Result<ItemPtr, Error>::Ok(std::move(removed));
}

Result<ItemPtr, Error> Registry::Get(ItemCategory category,
                                     const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& bucket = Bucket(category);
    auto it = FindByName(bucket, name);
    if (it == bucket.end()) {
        return Result<ItemPtr, Error>::Err(MakeNotFound(category, name));
    }
    return Result<ItemPtr, Error>::Ok(*it);
}

bool Registry::Has(ItemCategory category, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& bucket = Bucket(category);
    return FindByName(bucket, name) != bucket.end();
}

std::vector<ItemPtr> Registry::List(ItemCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Bucket(category);
}

std::vector<std::string> Registry::Names(ItemCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& item : Bucket(category)) {
        names.push_back(item->Name());
    }
    return names;
}

ItemPtr Registry::FindResourceByUri(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : resources_) {
        const auto& resource = item->AsResource();
        if (!resource.IsTemplate() && resource.uri == uri) {
            return item;
        }
    }
    return nullptr;
}

std::size_t Registry::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size() + resources_.size() + prompts_.size();
}

std::map<ItemCategory, std::size_t> Registry::CountByCategory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {ItemCategory::Tool, tools_.size()},
        {ItemCategory::Resource, resources_.size()},
        {ItemCategory::Prompt, prompts_.size()},
    };
}

void Registry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.clear();
    resources_.clear();
    prompts_.clear();
}

} // namespace mcp_bridge
