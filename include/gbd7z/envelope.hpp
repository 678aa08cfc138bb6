// ============================================================================
//  File: include/gbd7z/envelope.hpp — API publique encrypt / decrypt (DOC+)
//  Project: GBD7Z Envelope Cipher v1
//
//  PIPELINE
//  --------
//   encrypt : trit_split → chaos → stream_flow → block_sync → payload
//             → keyed_hash → text91 → "GBD7Z:" text "|" hash "&7"
//   decrypt : ordre inverse ; le hash est vérifié AVANT de défaire le moindre
//             étage de chiffrement.
//
//  GARDE-FOUS
//  ----------
//  • Aucun état global : chaos, clés de tour, multiplicateur, IV sont dérivés
//    à chaque appel. Fonctions réentrantes.
//  • En cas d’échec, les sorties sont vides (pas de résultat partiel).
//  • Déterministe : même clé + même clair → même enveloppe (pas de nonce).
//
//  API
//  ---
//   Status encrypt(key, plain, out_envelope, err*);
//   Status decrypt(key, envelope, out_plain, err*);
//   Status verify_envelope(key, envelope, err*);      // structure + hash seulement
//   Status inspect_envelope(envelope, info, err*);    // sans clé
//   Status parse_envelope(envelope, parts, err*);     // découpe texte / hash
//   std::string assemble_envelope(payload, hash);
//   bool   selftest_roundtrip();
//
//  EXEMPLES
//  --------
//   std::string env; std::string why;
//   if(gbd7z::encrypt(key, plain, env, &why) != gbd7z::Status::Ok) ...
//   gbd7z::Bytes back;
//   gbd7z::Status st = gbd7z::decrypt(key, env, back, &why);
//   if(st==gbd7z::Status::SecurityError) ... // mauvaise clé / altération
// ============================================================================

#pragma once
#include <cstdint>
#include <string>

#include "gbd7z/format.hpp"
#include "gbd7z/status.hpp"

namespace gbd7z
{

struct EnvelopeParts
{
    std::string encoded_payload; // texte entre "GBD7Z:" et le dernier '|'
    uint64_t    hash = 0;
};

struct EnvelopeInfo
{
    size_t   text_len     = 0; // longueur totale de l’enveloppe
    size_t   payload_len  = 0; // octets binaires
    uint32_t orig_len     = 0; // octets clairs
    uint64_t leaf_count   = 0; // Σ counts
    size_t   cipher_len   = 0; // octets après bases
    uint64_t hash         = 0;
    bool     leaf_count_matches = false; // leaf_count == cipher_len
};

std::string assemble_envelope(const Bytes& payload, uint64_t hash);
Status      parse_envelope(const std::string& envelope, EnvelopeParts& out, std::string* err = nullptr);

Status encrypt(const Bytes& key, const Bytes& plain, std::string& out_envelope, std::string* err = nullptr);
Status decrypt(const Bytes& key, const std::string& envelope, Bytes& out_plain, std::string* err = nullptr);

Status verify_envelope(const Bytes& key, const std::string& envelope, std::string* err = nullptr);
Status inspect_envelope(const std::string& envelope, EnvelopeInfo& info, std::string* err = nullptr);

// Aller-retour interne sur quelques couples (clé, clair) fixes.
bool selftest_roundtrip();

inline Bytes to_bytes(const std::string& s){ return Bytes(s.begin(), s.end()); }

} // namespace gbd7z
