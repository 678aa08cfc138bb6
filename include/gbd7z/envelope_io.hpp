// ============================================================================
//  File: include/gbd7z/envelope_io.hpp — Lecture / écriture fichiers
//  Project: GBD7Z Envelope Cipher v1
//
//  • read/write_file_bytes : contenu binaire brut (clair, clé).
//  • read_envelope_file    : texte, espaces / fins de ligne finaux retirés.
//  • write_envelope_file   : enveloppe + '\n'.
//  Échecs → Status::IoError, *err = strerror(errno) + chemin.
// ============================================================================

#pragma once
#include <string>

#include "gbd7z/format.hpp"
#include "gbd7z/status.hpp"

namespace gbd7z
{

Status read_file_bytes (const std::string& path, Bytes& out, std::string* err = nullptr);
Status write_file_bytes(const std::string& path, const Bytes& data, std::string* err = nullptr);

Status read_envelope_file (const std::string& path, std::string& out, std::string* err = nullptr);
Status write_envelope_file(const std::string& path, const std::string& envelope, std::string* err = nullptr);

// Retire espaces, tabulations, \r et \n en fin de chaîne.
std::string rstrip_line(const std::string& s);

} // namespace gbd7z
