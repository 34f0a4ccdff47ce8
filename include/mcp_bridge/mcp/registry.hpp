#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/primitives.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_bridge {

using ItemPtr = std::shared_ptr<const Item>;

// ---------------------------------------------------------------------------
// Registry: the catalog of tools, resources and prompts.
//
// Three independent collections keyed by name. A name is unique within its
// category and may repeat across categories. Enumeration follows insertion
// order. All operations lock; items are handed out as shared immutable
// handles so callers invoke handlers without holding the lock.
// ---------------------------------------------------------------------------
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // DuplicateName if (category, name) is already taken.
    Result<void, Error> Register(Item item);

    // NotFound if absent; returns the removed item.
    Result<ItemPtr, Error> Unregister(ItemCategory category, const std::string& name);

    // NotFound if absent.
    [[nodiscard]] Result<ItemPtr, Error> Get(ItemCategory category,
                                             const std::string& name) const;

    [[nodiscard]] bool Has(ItemCategory category, const std::string& name) const;

    // Snapshot in insertion order.
    [[nodiscard]] std::vector<ItemPtr> List(ItemCategory category) const;
    [[nodiscard]] std::vector<std::string> Names(ItemCategory category) const;

    // Resource registered under exactly this concrete URI (templates are
    // never considered). nullptr when none.
    [[nodiscard]] ItemPtr FindResourceByUri(const std::string& uri) const;

    [[nodiscard]] std::size_t Count() const;
    [[nodiscard]] std::map<ItemCategory, std::size_t> CountByCategory() const;

    void Clear();

private:
    std::vector<ItemPtr>& Bucket(ItemCategory category);
    const std::vector<ItemPtr>& Bucket(ItemCategory category) const;

    mutable std::mutex mutex_;
    std::vector<ItemPtr> tools_;
    std::vector<ItemPtr> resources_;
    std::vector<ItemPtr> prompts_;
};

} // namespace mcp_bridge
