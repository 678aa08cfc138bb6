// ============================================================================
//  File: include/gbd7z/trit_split.hpp — Décomposition base-3 des octets (DOC+)
//  Project: GBD7Z Envelope Cipher v1
//
//  BUT
//  ---
//  • Chaque octet v est écrit v = base * 3^levels, levels = nombre de
//    divisions exactes par 3 (v=0 : levels=0, base=0).
//  • count = 3^levels feuilles de valeur `base` sont émises dans le flux.
//  • Le décodage reconstruit v = base * count ; les feuilles ne sont que
//    comptées (leurs valeurs ne sont pas relues).
//
//  GARDE-FOUS
//  ----------
//  • count <= 0, feuilles manquantes ou en trop  → FormatError.
//  • base*count > 255                            → StateError.
//  • Les counts relus depuis un payload sont des i32 signés : on ne suppose
//    jamais qu’ils sont des puissances de 3.
//
//  API
//  ---
//   TritSplit trit_split_encode(const Bytes& plain);
//   Status    trit_split_decode(leaves, counts, bases, out_plain, err*);
// ============================================================================

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "gbd7z/format.hpp"
#include "gbd7z/status.hpp"

namespace gbd7z
{

struct TritSplit
{
    Bytes                leaves;
    std::vector<int32_t> counts; // 3^levels, un par octet clair
    Bytes                bases;
};

// Nombre de facteurs 3 de v (0 pour v=0).
inline int trit_levels(uint8_t v)
{
    if(v==0) return 0;
    int levels=0;
    unsigned t=v;
    while(t%3==0)
    {
        t/=3;
        ++levels;
    }
    return levels;
}

inline int32_t pow3(int e)
{
    int32_t p=1;
    for(int i=0; i<e; ++i) p*=3;
    return p;
}

TritSplit trit_split_encode(const Bytes& plain);

Status trit_split_decode(const Bytes& leaves,
                         const std::vector<int32_t>& counts,
                         const Bytes& bases,
                         Bytes& out_plain,
                         std::string* err = nullptr);

// Somme des counts (longueur attendue du flux de feuilles) ; -1 si un count <= 0.
int64_t trit_split_leaf_total(const std::vector<int32_t>& counts);

} // namespace gbd7z
