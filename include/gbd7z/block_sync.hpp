// ============================================================================
//  File: include/gbd7z/block_sync.hpp — Couche bloc 128 bits, 7 tours (DOC+)
//  Project: GBD7Z Envelope Cipher v1
//
//  TOUR r (chiffrement, r = 0..6), N = bloc lu en big-endian :
//   1. N = N + K1_r            (mod 2^128)
//   2. N = N * M               (mod 2^128, M impair donc inversible)
//   3. octets de N : pour i = 0..15, swap(b[i], b[(i + chaos[(i+r)%m]) % 16])
//   4. N = N ^ K2_r
//  Déchiffrement : r = 6..0, ordre inverse, swaps i = 15..0, M^-1, soustraction.
//
//  DÉRIVATION
//  ----------
//   M       : octet j = key[j % n], bit de poids faible forcé à 1.
//   K_{r,w} : octet j = (key[(j+r+w) % n] + ((r*31) ^ (w*13))) & 0xFF,
//             w=1 → K1, w=2 → K2.
//
//  LIMITES (conservées pour la compatibilité des enveloppes)
//  ---------------------------------------------------------
//  • Blocs indépendants : deux blocs clairs identiques → blocs chiffrés identiques.
//  • Bourrage zéro jusqu’au multiple de 16, puis troncature à la taille
//    d’entrée : le chiffré d’un dernier bloc partiel est tronqué et n’est pas
//    inversible. Le décodage base-3 ne relit pas les valeurs des feuilles, donc
//    l’aller-retour complet reste exact.
// ============================================================================

#pragma once
#include <cstdint>

#include "gbd7z/format.hpp"
#include "gbd7z/u128.hpp"

namespace gbd7z
{

// Matériel dérivé de la clé, recalculé à chaque appel.
struct BlockKeys
{
    U128 mul;
    U128 mul_inv;
    U128 k1[kBlockRounds];
    U128 k2[kBlockRounds];
};

U128      derive_odd_multiplier(const Bytes& key);
U128      derive_round_key(const Bytes& key, int round, int which);
BlockKeys derive_block_keys(const Bytes& key);

// Un bloc de 16 octets, en place.
void block_encrypt16(uint8_t* block, const BlockKeys& bk, const Bytes& chaos);
void block_decrypt16(uint8_t* block, const BlockKeys& bk, const Bytes& chaos);

// Pré : key et chaos non vides. Sortie de même taille que l’entrée.
Bytes block_sync_encrypt(const Bytes& data, const Bytes& key, const Bytes& chaos);
Bytes block_sync_decrypt(const Bytes& data, const Bytes& key, const Bytes& chaos);

} // namespace gbd7z
