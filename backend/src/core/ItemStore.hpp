#pragma once
#include <string>
#include <vector>
#include "Item.hpp"

// Persistence contract for per-item scheduling state. The engine never
// assumes a particular backend; implementations must be thread-safe.
class ItemStore {
public:
    virtual ~ItemStore() = default;

    // Throws NotFoundError
    virtual Item get(const std::string& id) const = 0;

    // Replaces the stored item only if its version() still equals expected.
    // Throws NotFoundError or ConflictError; returns the stored item.
    virtual Item compareAndSwap(const std::string& id, const ItemVersion& expected, const Item& updated) = 0;

    virtual std::vector<Item> listAll() const = 0;

    // Throws ConflictError if the id already exists
    virtual void insert(const Item& item) = 0;
};
