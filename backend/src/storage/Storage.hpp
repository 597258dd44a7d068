#pragma once
#include <vector>
#include <string>
#include "CardStore.hpp"

// Storage persists a CardStore (catalog, card states, review log) to one encrypted file.
//
// File layout:
//   Header: 8 bytes ASCII "SGDATA1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key derivation)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The key is derived from a passphrase with crypto_pwhash. Card states pass through
// CardState::clampToBounds on load. A missing file loads as an empty store.

class Storage {
public:
    // ENCRYPTED FILE
    static bool saveStore(const CardStore& store, const std::string& filename, const std::string& passphrase);
    static bool loadStore(CardStore& store, const std::string& filename, const std::string& passphrase);

    // PLAIN TEXT (the payload that gets encrypted)
    static std::string serialize(const CardStore& store);
    static bool deserialize(const std::string& plain, CardStore& store);

    // Key derivation (libsodium); returns false if the KDF fails
    static bool deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt,
        std::vector<unsigned char>& key);
};
