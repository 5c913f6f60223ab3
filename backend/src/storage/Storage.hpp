#pragma once
#include <vector>
#include <string>
#include "../core/Item.hpp"
#include "../core/ReviewEvent.hpp"

// Storage handles per-learner encrypted state files.
//
// File layout (items and review events alike):
//   Header: 8 bytes ASCII "SRDATA2\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes (crypto_secretbox_easy over the plain records)
//
// Plain records are line-oriented and terminated by a "---" line; absent
// timestamps are written as "-".
//
// All calls require a crypto_secretbox_KEYBYTES key. A missing file loads as
// empty; every other failure is logged and reported as false.

class Storage {
public:
    // ITEMS
    static bool saveItems(const std::vector<Item>& items, const std::string& filename, const std::vector<unsigned char>& key);
    static bool loadItems(std::vector<Item>& items, const std::string& filename, const std::vector<unsigned char>& key);

    // REVIEW EVENTS
    static bool saveEvents(const std::vector<ReviewEvent>& events, const std::string& filename, const std::vector<unsigned char>& key);
    static bool loadEvents(std::vector<ReviewEvent>& events, const std::string& filename, const std::vector<unsigned char>& key);

    // Plain (unencrypted) record format, exposed for tests and export
    static std::string serializeItems(const std::vector<Item>& items);
    static bool parseItems(const std::string& plain, std::vector<Item>& items);
    static std::string serializeEvents(const std::vector<ReviewEvent>& events);
    static bool parseEvents(const std::string& plain, std::vector<ReviewEvent>& events);

private:
    static bool writeSealed(const std::string& plain, const std::string& filename, const std::vector<unsigned char>& key);
    // found=false when the file does not exist
    static bool readSealed(std::string& plain, bool& found, const std::string& filename, const std::vector<unsigned char>& key);
};
