#include "encoding.hpp"
#include "secure_memory.hpp"

#include <sodium.h>

#include <cstdlib>
#include <iostream>

// Prints Ed25519 key pairs. The public key doubles as a bettor identity and the secret
// key signs published event-log roots.
int main(int argc, char* argv[]) {
    int count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = static_cast<int>(parsed);
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    for (int i = 0; i < count; ++i) {
        unsigned char publicKey[crypto_sign_PUBLICKEYBYTES];
        betme::SecretBytes secretKey(crypto_sign_SECRETKEYBYTES);
        if (crypto_sign_keypair(publicKey, secretKey.data()) != 0) {
            std::cerr << "Key generation failed\n";
            return 1;
        }
        std::cout << "identity=" << betme::bytesToHex(publicKey, sizeof(publicKey))
                  << " secret=" << betme::bytesToHex(secretKey.data(), secretKey.size()) << '\n';
    }

    return 0;
}
