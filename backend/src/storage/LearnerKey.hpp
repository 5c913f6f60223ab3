#pragma once

#include <string>
#include <vector>

// Derives the learner's data-file key from a passphrase (Argon2id via
// crypto_pwhash). The random salt lives hex-encoded in a small side file and
// is created on first unlock. Key bytes are wiped on lock() and destruction.
class LearnerKey {
public:
    explicit LearnerKey(const std::string& saltFile);
    ~LearnerKey();

    LearnerKey(const LearnerKey&) = delete;
    LearnerKey& operator=(const LearnerKey&) = delete;

    // False on empty passphrase, unreadable salt or derivation failure.
    // A wrong passphrase still derives a key; decryption is what rejects it.
    bool unlock(const std::string& passphrase);
    void lock();

    bool isUnlocked() const { return !key_bytes.empty(); }

    // Empty when locked
    const std::vector<unsigned char>& key() const;

private:
    std::string saltFilePath;
    std::vector<unsigned char> key_bytes;

    bool loadOrCreateSalt(std::vector<unsigned char>& salt);
};
