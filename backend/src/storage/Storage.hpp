#pragma once
#include <vector>
#include <string>
#include "../core/ReviewRecord.hpp"

// Storage handles the encrypted per-owner review file.
//
// File layout:
//   Header: 8 bytes ASCII "SRSREV1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key derivation salt, stored in the clear)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// Plaintext is one block per record (see serializeReviews), each ended by "---".
// saveReviews/loadReviews require a derived key of crypto_secretbox_KEYBYTES; otherwise they return false.

class Storage {
public:
    static std::string serializeReviews(const std::vector<ReviewRecord>& records);
    // Malformed blocks are skipped with a warning; returns the number skipped.
    static std::size_t parseReviews(const std::string& plain, std::vector<ReviewRecord>& records);

    static bool saveReviews(const std::vector<ReviewRecord>& records, const std::string& filename,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& salt);
    static bool loadReviews(std::vector<ReviewRecord>& records, const std::string& filename,
        const std::vector<unsigned char>& key);

    // Reads the salt of an existing file. false if the file is missing or has a bad header.
    static bool readSalt(const std::string& filename, std::vector<unsigned char>& salt);
    static std::vector<unsigned char> randomSalt();

    // Argon2id key derivation (crypto_pwhash). Throws std::runtime_error when libsodium runs out of memory.
    static std::vector<unsigned char> deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt);
};
