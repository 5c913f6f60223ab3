#include "LearnerKey.hpp"
#include <sodium.h>
#include <fstream>
#include <spdlog/spdlog.h>

// constants for key derivation / pwhash
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;      // recommended salt size

// Helper: hex-encode salt bytes to string
static std::string saltToHex(const unsigned char* salt, size_t len) {
    std::string hex(2 * len + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), salt, len);
    hex.resize(2 * len);
    return hex;
}

// Helper: hex string to bytes
static bool hexToSalt(const std::string& hex, std::vector<unsigned char>& out) {
    out.resize(SALT_BYTES);
    size_t bin_len = 0;

    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &bin_len, nullptr) != 0)
    {
        spdlog::error("Failed to convert hex salt to binary");
        return false;
    }

    if (bin_len != SALT_BYTES) {
        spdlog::error("Salt length mismatch while decoding");
        return false;
    }

    return true;
}

LearnerKey::LearnerKey(const std::string& saltFile)
    : saltFilePath(saltFile)
{
    spdlog::debug("LearnerKey bound to salt file '{}'", saltFilePath);
}

LearnerKey::~LearnerKey() {
    lock();
}

bool LearnerKey::loadOrCreateSalt(std::vector<unsigned char>& salt) {
    std::ifstream in(saltFilePath);
    if (in) {
        std::string hex;
        std::getline(in, hex);
        return hexToSalt(hex, salt);
    }

    spdlog::info("No salt at '{}'; creating a new one", saltFilePath);
    salt.resize(SALT_BYTES);
    randombytes_buf(salt.data(), SALT_BYTES);

    std::ofstream out(saltFilePath, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to write salt file '{}'", saltFilePath);
        return false;
    }
    out << saltToHex(salt.data(), salt.size()) << "\n";
    return static_cast<bool>(out);
}

bool LearnerKey::unlock(const std::string& passphrase) {
    spdlog::debug("Deriving learner key (not logging passphrase or salt)");

    if (passphrase.empty()) {
        spdlog::warn("unlock() called with empty passphrase");
        return false;
    }

    std::vector<unsigned char> salt;
    if (!loadOrCreateSalt(salt)) {
        spdlog::error("Failed to obtain salt for key derivation");
        return false;
    }

    key_bytes.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key_bytes.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation (likely out of memory)");
        key_bytes.clear();
        return false;
    }

    spdlog::debug("Learner key derived successfully");
    return true;
}

void LearnerKey::lock() {
    if (!key_bytes.empty()) {
        spdlog::debug("Clearing learner key from memory");
        sodium_memzero(key_bytes.data(), key_bytes.size());
        key_bytes.clear();
    }
}

const std::vector<unsigned char>& LearnerKey::key() const {
    return key_bytes;
}
