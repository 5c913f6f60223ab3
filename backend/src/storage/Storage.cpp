#include "Storage.hpp"
#include <fstream>
#include <sstream>
#include <cstring>
#include <cstdio>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "SRDATA2\n";
static const char RECORD_END[] = "---";

static void writeTime(std::ostream& out, const std::optional<std::time_t>& t) {
    if (t) out << *t;
    else out << "-";
}

static bool readTime(std::istream& in, std::optional<std::time_t>& t) {
    std::string tok;
    if (!(in >> tok)) return false;
    if (tok == "-") {
        t.reset();
        return true;
    }
    try {
        t = static_cast<std::time_t>(std::stoll(tok));
    }
    catch (const std::exception&) {
        return false;
    }
    return true;
}

std::string Storage::serializeItems(const std::vector<Item>& items) {
    std::ostringstream oss;
    oss.precision(17);

    for (const auto& it : items) {
        oss << it.id << "\n"
            << it.item_type << "\n"
            << it.ease_factor << " "
            << it.interval_days << " "
            << it.repetitions << " "
            << it.total_reviews << " "
            << it.created_at << " ";
        writeTime(oss, it.last_review_at);
        oss << " ";
        writeTime(oss, it.next_review_at);
        oss << " ";
        writeTime(oss, it.first_review_at);
        oss << "\n" << RECORD_END << "\n";
    }

    return oss.str();
}

bool Storage::parseItems(const std::string& plain, std::vector<Item>& items) {
    std::istringstream iss(plain);
    items.clear();

    while (true) {
        Item it;
        if (!std::getline(iss, it.id)) break;
        if (it.id.empty()) break;
        if (!std::getline(iss, it.item_type)) return false;

        std::string fields;
        if (!std::getline(iss, fields)) return false;
        std::istringstream fss(fields);
        if (!(fss >> it.ease_factor >> it.interval_days >> it.repetitions >> it.total_reviews >> it.created_at))
            return false;
        if (!readTime(fss, it.last_review_at)) return false;
        if (!readTime(fss, it.next_review_at)) return false;
        if (!readTime(fss, it.first_review_at)) return false;

        std::string sep;
        if (!std::getline(iss, sep) || sep != RECORD_END) return false;

        items.push_back(it);
    }

    return true;
}

std::string Storage::serializeEvents(const std::vector<ReviewEvent>& events) {
    std::ostringstream oss;
    oss.precision(17);

    for (const auto& e : events) {
        oss << e.item_id << "\n"
            << e.item_type << "\n"
            << e.submitted_at << " "
            << e.quality << " "
            << e.time_spent_seconds << " "
            << e.resulting_interval_days << " "
            << e.resulting_ease_factor << "\n"
            << RECORD_END << "\n";
    }

    return oss.str();
}

bool Storage::parseEvents(const std::string& plain, std::vector<ReviewEvent>& events) {
    std::istringstream iss(plain);
    events.clear();

    while (true) {
        ReviewEvent e;
        if (!std::getline(iss, e.item_id)) break;
        if (e.item_id.empty()) break;
        if (!std::getline(iss, e.item_type)) return false;

        std::string fields;
        if (!std::getline(iss, fields)) return false;
        std::istringstream fss(fields);
        if (!(fss >> e.submitted_at >> e.quality >> e.time_spent_seconds
                  >> e.resulting_interval_days >> e.resulting_ease_factor))
            return false;

        std::string sep;
        if (!std::getline(iss, sep) || sep != RECORD_END) return false;

        events.push_back(e);
    }

    return true;
}

bool Storage::writeSealed(const std::string& plain, const std::string& filename, const std::vector<unsigned char>& key) {
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    // Write to a sibling file first so a crash never leaves a torn state file
    std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to move '{}' into place as '{}'", tmp, filename);
        return false;
    }
    return true;
}

bool Storage::readSealed(std::string& plain, bool& found, const std::string& filename, const std::vector<unsigned char>& key) {
    found = false;
    plain.clear();

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        return true;
    }
    found = true;

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> buf(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(buf.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupt file '{}')", filename);
        return false;
    }

    plain.assign(reinterpret_cast<const char*>(buf.data()), buf.size());
    sodium_memzero(buf.data(), buf.size());
    return true;
}

bool Storage::saveItems(const std::vector<Item>& items, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Saving {} encrypted items to '{}'", items.size(), filename);
    return writeSealed(serializeItems(items), filename, key);
}

bool Storage::loadItems(std::vector<Item>& items, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Loading encrypted items from '{}'", filename);
    items.clear();

    std::string plain;
    bool found = false;
    if (!readSealed(plain, found, filename, key)) return false;
    if (!found) {
        spdlog::warn("Item file '{}' not found; treating as empty", filename);
        return true;
    }

    if (!parseItems(plain, items)) {
        spdlog::error("Malformed item records in '{}'", filename);
        items.clear();
        return false;
    }

    spdlog::info("Loaded {} items", items.size());
    return true;
}

bool Storage::saveEvents(const std::vector<ReviewEvent>& events, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::debug("Saving {} encrypted review events to '{}'", events.size(), filename);
    return writeSealed(serializeEvents(events), filename, key);
}

bool Storage::loadEvents(std::vector<ReviewEvent>& events, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Loading encrypted review events from '{}'", filename);
    events.clear();

    std::string plain;
    bool found = false;
    if (!readSealed(plain, found, filename, key)) return false;
    if (!found) {
        spdlog::warn("Review log '{}' not found; treating as empty", filename);
        return true;
    }

    if (!parseEvents(plain, events)) {
        spdlog::error("Malformed review records in '{}'", filename);
        events.clear();
        return false;
    }

    spdlog::info("Loaded {} review events", events.size());
    return true;
}
