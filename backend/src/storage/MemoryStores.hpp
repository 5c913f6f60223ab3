#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../core/ItemStore.hpp"
#include "../core/ReviewEventStore.hpp"

// Mutex-guarded in-process stores. Also the base of the encrypted file
// stores, which persist the whole collection after every mutation.
class MemoryItemStore : public ItemStore {
public:
    MemoryItemStore() = default;
    explicit MemoryItemStore(const std::vector<Item>& initial);

    Item get(const std::string& id) const override;
    Item compareAndSwap(const std::string& id, const ItemVersion& expected, const Item& updated) override;
    std::vector<Item> listAll() const override;
    void insert(const Item& item) override;

    size_t size() const;

protected:
    // Called with the lock held after a mutation; false rolls it back
    virtual bool onChanged(const std::vector<Item>& snapshot);

    std::vector<Item> snapshotLocked() const;

    mutable std::mutex mtx;
    std::map<std::string, Item> items;
};

class MemoryReviewEventStore : public ReviewEventStore {
public:
    MemoryReviewEventStore() = default;
    explicit MemoryReviewEventStore(const std::vector<ReviewEvent>& initial);

    void append(const ReviewEvent& event) override;
    std::vector<ReviewEvent> query(std::time_t from, std::time_t to) const override;

    size_t size() const;

protected:
    virtual bool onChanged(const std::vector<ReviewEvent>& all);

    mutable std::mutex mtx;
    std::vector<ReviewEvent> events;   // Kept sorted by submitted_at
};
