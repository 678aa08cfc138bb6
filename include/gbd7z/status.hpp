// ============================================================================
//  File: include/gbd7z/status.hpp — Codes de retour (DOC+)
//  Project: GBD7Z Envelope Cipher v1
//
//  RÔLE
//  -----
//  • Toutes les opérations renvoient un `Status` ; pas d’exceptions.
//  • Un `std::string* err` optionnel reçoit une raison sur une ligne.
//  • FormatError et SecurityError restent distincts : l’appelant doit pouvoir
//    réagir différemment à une enveloppe mal formée et à un hash faux.
// ============================================================================

#pragma once
#include <cstdint>
#include <string>

namespace gbd7z
{

enum class Status : uint8_t
{
    Ok              = 0,
    InvalidArgument = 1, // clé vide, clair trop long
    FormatError     = 2, // enveloppe / payload / texte / comptes invalides
    SecurityError   = 3, // hash différent : mauvaise clé ou données altérées
    StateError      = 4, // base*count hors 0..255
    IoError         = 5  // helpers fichiers
};

inline const char* status_name(Status s)
{
    switch(s)
    {
    case Status::Ok:
        return "OK";
    case Status::InvalidArgument:
        return "INVALID_ARGUMENT";
    case Status::FormatError:
        return "FORMAT_ERROR";
    case Status::SecurityError:
        return "SECURITY_ERROR";
    case Status::StateError:
        return "STATE_ERROR";
    case Status::IoError:
        return "IO_ERROR";
    default:
        return "UNKNOWN";
    }
}

inline bool ok(Status s){ return s==Status::Ok; }

// Renseigne *err (si fourni) et renvoie s, pour les retours d’erreur en une ligne.
inline Status fail(Status s, std::string* err, const std::string& why)
{
    if(err) *err = why;
    return s;
}

} // namespace gbd7z
