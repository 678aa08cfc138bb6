// ============================================================================
//  File: src/gbd7z_tool.cpp — CLI pour enveloppes GBD7Z
//  Project: GBD7Z Envelope Cipher v1
//
//  COMMANDES
//  ---------
//  gbd7z_tool encrypt <clé> (--in clair.bin | --text "...") [--out env.txt] [--verbose]
//  gbd7z_tool decrypt <clé> (--in env.txt | --envelope "...") [--out clair.bin] [--verbose]
//  gbd7z_tool verify  <clé> (--in env.txt | --envelope "...")
//  gbd7z_tool info    (--in env.txt | --envelope "...") [--json]
//  gbd7z_tool selftest
//
//  <clé> : --key TEXTE | --key-hex 6b6579 | --key-file cle.bin
//
//  CODES DE SORTIE
//  ---------------
//   0 OK, 1 échec, 2 usage, 3 hash différent (mauvaise clé / altération)
// ============================================================================

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "gbd7z/envelope.hpp"
#include "gbd7z/envelope_io.hpp"
#include "gbd7z/keyed_hash.hpp"

using namespace gbd7z;

// ---------------------------------------------------------------------- Usage
static void usage()
{
    std::cerr <<
              "gbd7z_tool encrypt <key> (--in <plain.bin> | --text <str>) [--out <env.txt>] [--verbose]\n"
              "gbd7z_tool decrypt <key> (--in <env.txt> | --envelope <str>) [--out <plain.bin>] [--verbose]\n"
              "gbd7z_tool verify  <key> (--in <env.txt> | --envelope <str>)\n"
              "gbd7z_tool info    (--in <env.txt> | --envelope <str>) [--json]\n"
              "gbd7z_tool selftest\n"
              "  <key> = --key <text> | --key-hex <hex> | --key-file <file>\n";
}

struct ToolConfig
{
    std::string key_text, key_hex, key_file;
    bool        has_key_text = false, has_key_hex = false, has_key_file = false;
    std::string in, out, text, envelope;
    bool        has_text = false, has_envelope = false;
    bool        json = false;
    bool        verbose = false;
};

static bool parse_args(int argc, char** argv, ToolConfig& c)
{
    for(int i=2; i<argc; ++i)
    {
        std::string s=argv[i];
        if(s=="--key" && i+1<argc)
        {
            c.key_text=argv[++i];
            c.has_key_text=true;
        }
        else if(s=="--key-hex" && i+1<argc)
        {
            c.key_hex=argv[++i];
            c.has_key_hex=true;
        }
        else if(s=="--key-file" && i+1<argc)
        {
            c.key_file=argv[++i];
            c.has_key_file=true;
        }
        else if(s=="--in" && i+1<argc)       c.in=argv[++i];
        else if(s=="--out" && i+1<argc)      c.out=argv[++i];
        else if(s=="--text" && i+1<argc)
        {
            c.text=argv[++i];
            c.has_text=true;
        }
        else if(s=="--envelope" && i+1<argc)
        {
            c.envelope=argv[++i];
            c.has_envelope=true;
        }
        else if(s=="--json")    c.json=true;
        else if(s=="--verbose") c.verbose=true;
        else
        {
            std::cerr<<"[gbd7z_tool] unknown argument: "<<s<<"\n";
            return false;
        }
    }
    return true;
}

static bool hex_to_bytes(const std::string& hex, Bytes& out)
{
    auto nib=[](char ch)->int
    {
        if(ch>='0'&&ch<='9') return ch-'0';
        if(ch>='a'&&ch<='f') return 10+(ch-'a');
        if(ch>='A'&&ch<='F') return 10+(ch-'A');
        return -1;
    };
    out.clear();
    if(hex.size()%2) return false;
    for(size_t i=0; i<hex.size(); i+=2)
    {
        int h=nib(hex[i]), l=nib(hex[i+1]);
        if(h<0||l<0) return false;
        out.push_back((uint8_t)(h*16+l));
    }
    return true;
}

static int exit_code_for(Status s)
{
    if(s==Status::Ok) return 0;
    if(s==Status::SecurityError) return 3;
    return 1;
}

static int report_failure(const char* op, Status s, const std::string& why)
{
    std::cerr<<"[gbd7z_tool] "<<op<<" failed: "<<status_name(s)<<" ("<<why<<")\n";
    return exit_code_for(s);
}

// Exactement une source de clé ; clé non vide.
// Retourne le code de sortie : 0 OK, 2 usage, 1 fichier illisible.
static int load_key(const ToolConfig& c, Bytes& key)
{
    const int sources = (c.has_key_text?1:0) + (c.has_key_hex?1:0) + (c.has_key_file?1:0);
    if(sources!=1)
    {
        std::cerr<<"[gbd7z_tool] exactly one of --key, --key-hex, --key-file is required\n";
        return 2;
    }
    if(c.has_key_text) key = to_bytes(c.key_text);
    else if(c.has_key_hex)
    {
        if(!hex_to_bytes(c.key_hex, key))
        {
            std::cerr<<"[gbd7z_tool] --key-hex: invalid hex string\n";
            return 2;
        }
    }
    else
    {
        std::string why;
        Status st = read_file_bytes(c.key_file, key, &why);
        if(!ok(st)) return report_failure("key", st, why);
    }
    if(key.empty())
    {
        std::cerr<<"[gbd7z_tool] key must be non-empty\n";
        return 2;
    }
    return 0;
}

// Même convention que load_key.
static int load_envelope(const ToolConfig& c, std::string& env)
{
    if(c.has_envelope == !c.in.empty())
    {
        std::cerr<<"[gbd7z_tool] exactly one of --in, --envelope is required\n";
        return 2;
    }
    if(c.has_envelope)
    {
        env = rstrip_line(c.envelope);
        return 0;
    }
    std::string why;
    Status st = read_envelope_file(c.in, env, &why);
    if(!ok(st)) return report_failure("read", st, why);
    return 0;
}

static void print_info(const EnvelopeInfo& info, bool json, std::ostream& os)
{
    if(json)
    {
        os << "{\n"
           << "  \"gbd7z\": {\n"
           << "    \"text_len\": "<<info.text_len<<", \"payload_len\": "<<info.payload_len<<",\n"
           << "    \"orig_len\": "<<info.orig_len<<", \"leaf_count\": "<<info.leaf_count<<",\n"
           << "    \"cipher_len\": "<<info.cipher_len<<",\n"
           << "    \"leaf_count_matches\": "<<(info.leaf_count_matches? "true":"false")<<",\n"
           << "    \"hash\": \""<<hash_to_hex(info.hash)<<"\"\n"
           << "  }\n}\n";
    }
    else
    {
        os << "== GBD7Z envelope ==\n"
           << "text: "<<info.text_len<<" chars  payload: "<<info.payload_len<<" bytes\n"
           << "plain: "<<info.orig_len<<" bytes  leaves: "<<info.leaf_count
           << "  cipher: "<<info.cipher_len<<" bytes"
           << (info.leaf_count_matches? "" : "  (leaf count mismatch)")<<"\n"
           << "hash: "<<hash_to_hex(info.hash)<<"\n";
    }
}

static void trace_envelope(const std::string& env)
{
    EnvelopeInfo info;
    std::string why;
    if(ok(inspect_envelope(env, info, &why))) print_info(info, false, std::cerr);
    else std::cerr<<"[gbd7z_tool] inspect: "<<why<<"\n";
}

// ============================================================================
// main
// ============================================================================
int main(int argc, char** argv)
{
    if(argc<2)
    {
        usage();
        return 2;
    }
    std::string cmd = argv[1];

    // ---------------------------------------------------------------- SELFTEST
    if(cmd=="selftest")
    {
        bool okrt = selftest_roundtrip();
        std::cout<<"API roundtrip: "<<(okrt?"OK":"FAIL")<<"\n";
        return okrt? 0 : 1;
    }

    ToolConfig cfg;
    if(!parse_args(argc, argv, cfg))
    {
        usage();
        return 2;
    }

    // ----------------------------------------------------------------- ENCRYPT
    if(cmd=="encrypt")
    {
        Bytes key;
        if(int rc = load_key(cfg, key)) return rc;
        if(cfg.has_text == !cfg.in.empty())
        {
            std::cerr<<"[gbd7z_tool] exactly one of --in, --text is required\n";
            return 2;
        }
        Bytes plain;
        std::string why;
        if(cfg.has_text) plain = to_bytes(cfg.text);
        else if(!ok(read_file_bytes(cfg.in, plain, &why)))
        {
            std::cerr<<"[gbd7z_tool] "<<why<<"\n";
            return 1;
        }

        std::string env;
        Status st = encrypt(key, plain, env, &why);
        if(!ok(st)) return report_failure("encrypt", st, why);
        if(cfg.verbose) trace_envelope(env);

        if(cfg.out.empty()) std::cout<<env<<"\n";
        else
        {
            st = write_envelope_file(cfg.out, env, &why);
            if(!ok(st)) return report_failure("write", st, why);
            std::cout<<"OK: wrote "<<cfg.out<<"  (plain="<<plain.size()<<", text="<<env.size()<<")\n";
        }
        return 0;
    }

    // ----------------------------------------------------------------- DECRYPT
    if(cmd=="decrypt")
    {
        Bytes key;
        if(int rc = load_key(cfg, key)) return rc;
        std::string env;
        if(int rc = load_envelope(cfg, env)) return rc;
        if(cfg.verbose) trace_envelope(env);

        Bytes plain;
        std::string why;
        Status st = decrypt(key, env, plain, &why);
        if(!ok(st)) return report_failure("decrypt", st, why);

        if(cfg.out.empty())
        {
            std::cout.write((const char*)plain.data(), (std::streamsize)plain.size());
            std::cout<<"\n";
        }
        else
        {
            st = write_file_bytes(cfg.out, plain, &why);
            if(!ok(st)) return report_failure("write", st, why);
            std::cout<<"OK: wrote "<<cfg.out<<"  ("<<plain.size()<<" bytes)\n";
        }
        return 0;
    }

    // ------------------------------------------------------------------ VERIFY
    if(cmd=="verify")
    {
        Bytes key;
        if(int rc = load_key(cfg, key)) return rc;
        std::string env;
        if(int rc = load_envelope(cfg, env)) return rc;

        std::string why;
        Status st = verify_envelope(key, env, &why);
        if(!ok(st)) return report_failure("verify", st, why);
        std::cout<<"OK: hash matches\n";
        return 0;
    }

    // -------------------------------------------------------------------- INFO
    if(cmd=="info")
    {
        std::string env;
        if(int rc = load_envelope(cfg, env)) return rc;
        EnvelopeInfo info;
        std::string why;
        Status st = inspect_envelope(env, info, &why);
        if(!ok(st)) return report_failure("info", st, why);
        print_info(info, cfg.json, std::cout);
        return 0;
    }

    std::cerr<<"[gbd7z_tool] unknown command: "<<cmd<<"\n";
    usage();
    return 2;
}
