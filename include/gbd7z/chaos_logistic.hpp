// ============================================================================
//  File: include/gbd7z/chaos_logistic.hpp — Générateur chaotique (logistique)
//  Project: GBD7Z Envelope Cipher v1
//
//  x0 = (Σkey mod 1024)/1024 + 0.123456
//  r0 = 3.9 + (key[0] mod 9) * 0.01
//  pas i : x = fmod(r*x*(1-x), 1) ; out[i] = floor(frac(x)*256) & 0xFF
//          r += ((key[i mod n] mod 5) - 2) * 0.0003
//
//  NOTE : double IEEE-754, évaluation gauche→droite, sans contraction FMA
//  (le build force -ffp-contract=off). x peut devenir négatif (x0 > 1) : frac()
//  passe par floor(), pas par une troncature.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>

#include "gbd7z/format.hpp"

namespace gbd7z
{

// Suite chaotique de `len` octets. Pré : key non vide.
Bytes logistic_chaos(const Bytes& key, size_t len = kChaosLen);

} // namespace gbd7z
