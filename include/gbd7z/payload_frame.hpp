// ============================================================================
//  File: include/gbd7z/payload_frame.hpp — Payload binaire (build / parse)
//  Project: GBD7Z Envelope Cipher v1
//
//  [origLen:i32][countsLen:i32][counts: origLen×i32][bases: origLen×u8][cipher]
//  BE. countsLen est redondant (= origLen) : un écart est une FormatError.
//  La longueur du chiffré n’est pas stockée : c’est le reste du buffer.
// ============================================================================

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "gbd7z/format.hpp"
#include "gbd7z/status.hpp"

namespace gbd7z
{

struct PayloadParts
{
    std::vector<int32_t> counts;
    Bytes                bases;
    Bytes                cipher;
};

// Pré : counts.size()==bases.size() ≤ INT32_MAX.
Bytes payload_build(const std::vector<int32_t>& counts, const Bytes& bases, const Bytes& cipher);

Status payload_parse(const Bytes& payload, PayloadParts& out, std::string* err = nullptr);

} // namespace gbd7z
