// ============================================================================
//  File: src/envelope_io.cpp — Helpers fichiers (RAII FILE*)
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/envelope_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace gbd7z
{

namespace {

struct File {
    FILE* f=nullptr;
    ~File(){ if(f) std::fclose(f); }
    bool open(const std::string& p, const char* mode){ f=std::fopen(p.c_str(), mode); return f!=nullptr; }
    // fclose explicite pour remonter les erreurs d’écriture différées.
    bool close(){ FILE* g=f; f=nullptr; return g==nullptr || std::fclose(g)==0; }
};

Status io_fail(const std::string& what, const std::string& path, std::string* err)
{
    return fail(Status::IoError, err, what+" "+path+": "+std::strerror(errno));
}

} // namespace

Status read_file_bytes(const std::string& path, Bytes& out, std::string* err)
{
    out.clear();
    File fp;
    if(!fp.open(path, "rb")) return io_fail("cannot open", path, err);

    Bytes data;
    uint8_t buf[4096];
    size_t n=0;
    while((n=std::fread(buf, 1, sizeof(buf), fp.f))>0) data.insert(data.end(), buf, buf+n);
    if(std::ferror(fp.f)) return io_fail("read failed", path, err);

    out.swap(data);
    return Status::Ok;
}

Status write_file_bytes(const std::string& path, const Bytes& data, std::string* err)
{
    File fp;
    if(!fp.open(path, "wb")) return io_fail("cannot open", path, err);
    if(!data.empty() && std::fwrite(data.data(), 1, data.size(), fp.f)!=data.size())
        return io_fail("write failed", path, err);
    if(!fp.close()) return io_fail("close failed", path, err);
    return Status::Ok;
}

std::string rstrip_line(const std::string& s)
{
    size_t end=s.size();
    while(end>0 && (s[end-1]=='\n' || s[end-1]=='\r' || s[end-1]==' ' || s[end-1]=='\t')) --end;
    return s.substr(0, end);
}

Status read_envelope_file(const std::string& path, std::string& out, std::string* err)
{
    out.clear();
    Bytes raw;
    Status st = read_file_bytes(path, raw, err);
    if(!ok(st)) return st;
    out = rstrip_line(std::string(raw.begin(), raw.end()));
    return Status::Ok;
}

Status write_envelope_file(const std::string& path, const std::string& envelope, std::string* err)
{
    Bytes data(envelope.begin(), envelope.end());
    data.push_back('\n');
    return write_file_bytes(path, data, err);
}

} // namespace gbd7z
