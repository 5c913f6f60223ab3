#pragma once
#include <string>
#include <vector>
#include "MemoryStores.hpp"
#include "LearnerKey.hpp"

// File-backed stores: state lives in memory and the whole collection is
// rewritten through Storage after every mutation. A failed write rolls the
// mutation back and surfaces as StorageError.
//
// The stores read the key from the LearnerKey on every write and keep no
// copy of it; once the key is locked, further mutations fail.
class EncryptedItemStore : public MemoryItemStore {
public:
    // Loads existing state; throws StorageError if the key is locked or the
    // file is unreadable
    EncryptedItemStore(const std::string& filename, const LearnerKey& key);

    // Explicit full rewrite (e.g. on exit)
    void flush();

protected:
    bool onChanged(const std::vector<Item>& snapshot) override;

private:
    std::string filename;
    const LearnerKey& learnerKey;
};

class EncryptedReviewEventStore : public MemoryReviewEventStore {
public:
    EncryptedReviewEventStore(const std::string& filename, const LearnerKey& key);

    void flush();

protected:
    bool onChanged(const std::vector<ReviewEvent>& all) override;

private:
    std::string filename;
    const LearnerKey& learnerKey;
};
