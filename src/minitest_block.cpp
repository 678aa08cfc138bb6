// ============================================================================
//  File: src/minitest_block.cpp — Tests arithmétique 128 bits & couche bloc
//  Project: GBD7Z Envelope Cipher v1
//
//  [B1] U128 : retenues, produit 64×64, inverse modulaire
//  [B2] dérivation M / K1 / K2 (vecteurs de référence)
//  [B3] bloc : vecteurs de référence, inversibilité, fuite blocs identiques,
//       troncature du dernier bloc partiel
// ============================================================================

#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "gbd7z/block_sync.hpp"
#include "gbd7z/chaos_logistic.hpp"

using namespace gbd7z;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static Bytes B(const std::string& s){ return Bytes(s.begin(), s.end()); }

static Bytes from_hex(const std::string& h){
    Bytes out;
    for(size_t i=0;i+1<h.size();i+=2) out.push_back((uint8_t)std::stoul(h.substr(i,2), nullptr, 16));
    return out;
}
static U128 u128_hex(const std::string& h){
    Bytes b = from_hex(h);
    return u128_from_be(b.data());
}

// ------------------ B1 : U128 ------------------------------------------------
static bool test_u128(){
    const uint64_t M = ~0ull;
    U128 a{0, M}, one{0, 1};
    T_ASSERT( (u128_add(a, one)==U128{1, 0}) );
    T_ASSERT( (u128_sub(U128{1, 0}, one)==a) );
    T_ASSERT( (u128_sub(U128{0, 0}, one)==U128{M, M}) );
    T_ASSERT( (u128_add(U128{M, M}, one)==U128{0, 0}) );

    T_ASSERT( (u128_mul64(M, M)==U128{M-1, 1}) );
    T_ASSERT( (u128_mul64(0x100000000ull, 0x100000000ull)==U128{1, 0}) );
    T_ASSERT( (u128_mul(U128{0, M}, U128{0, M})==U128{M-1, 1}) );
    T_ASSERT( (u128_mul(U128{M, M}, U128{M, M})==one) ); // (-1)*(-1)

    std::mt19937_64 rng(77);
    for(int i=0;i<200;++i){
        U128 m{rng(), rng() | 1ull};
        U128 inv = u128_inverse_odd(m);
        T_ASSERT( u128_mul(m, inv)==one );
        U128 x{rng(), rng()};
        T_ASSERT( u128_mul(u128_mul(x, m), inv)==x );
        T_ASSERT( u128_sub(u128_add(x, m), m)==x );
    }

    uint8_t be[16];
    U128 v = u128_hex("0102030405060708090a0b0c0d0e0f10");
    T_ASSERT( v.hi==0x0102030405060708ull && v.lo==0x090a0b0c0d0e0f10ull );
    u128_to_be(v, be);
    T_ASSERT( be[0]==0x01 && be[15]==0x10 );
    return true;
}

// ------------------ B2 : dérivation ------------------------------------------
static bool test_derivation(){
    const Bytes key = B("secret");
    BlockKeys bk = derive_block_keys(key);
    T_ASSERT( bk.mul==u128_hex("73656372657473656372657473656373") );
    T_ASSERT( bk.mul_inv==u128_hex("1eb703f30d2eb886b867d5b2bd9579bb") );
    T_ASSERT( bk.k1[0]==u128_hex("72707f72818072707f72818072707f72") );
    T_ASSERT( bk.k2[6]==u128_hex("03120514130503120514130503120514") );
    T_ASSERT( (bk.mul.lo & 1u)==1u );

    // clé paire : le bit bas est forcé
    U128 m = derive_odd_multiplier(Bytes{0x02});
    T_ASSERT( m.lo==0x0202020202020203ull && m.hi==0x0202020202020202ull );
    return true;
}

// ------------------ B3 : bloc ------------------------------------------------
static bool test_blocks(){
    const Bytes key = B("secret");
    const Bytes chaos = logistic_chaos(key);

    Bytes plain(16);
    for(int i=0;i<16;++i) plain[i]=(uint8_t)i;
    const Bytes ref = from_hex("be18e48482f0c13aaa817aedb7c25fff");
    Bytes c = block_sync_encrypt(plain, key, chaos);
    T_ASSERT( c==ref );
    T_ASSERT( block_sync_decrypt(c, key, chaos)==plain );

    // deux blocs identiques → chiffrés identiques (pas de chaînage inter-blocs)
    Bytes two = plain; two.insert(two.end(), plain.begin(), plain.end());
    Bytes c2 = block_sync_encrypt(two, key, chaos);
    T_ASSERT( c2.size()==32 );
    T_ASSERT( Bytes(c2.begin(), c2.begin()+16)==Bytes(c2.begin()+16, c2.end()) );

    // dernier bloc partiel : taille conservée, préfixe des blocs pleins identique
    Bytes p20(20);
    for(int i=0;i<20;++i) p20[i]=(uint8_t)i;
    Bytes c20 = block_sync_encrypt(p20, key, chaos);
    T_ASSERT( c20==from_hex("be18e48482f0c13aaa817aedb7c25fffde55fcdf") );
    Bytes d20 = block_sync_decrypt(c20, key, chaos);
    T_ASSERT( d20.size()==20 );
    T_ASSERT( Bytes(d20.begin(), d20.begin()+16)==Bytes(p20.begin(), p20.begin()+16) );

    // inversibilité : clés et blocs aléatoires
    std::mt19937 rng(4242);
    for(int t=0;t<64;++t){
        Bytes k(1 + rng()%40);
        for(auto& b : k) b=(uint8_t)(rng()&0xFF);
        Bytes ch = logistic_chaos(k);
        Bytes data(16*(1 + rng()%4));
        for(auto& b : data) b=(uint8_t)(rng()&0xFF);
        T_ASSERT( block_sync_decrypt(block_sync_encrypt(data, k, ch), k, ch)==data );
    }

    T_ASSERT( block_sync_encrypt(Bytes(), key, chaos).empty() );
    return true;
}

int main(){
    bool ok = true;
    ok &= test_u128();
    std::cout << "[B1] u128 arithmetic : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_derivation();
    std::cout << "[B2] key derivation  : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_blocks();
    std::cout << "[B3] block layer     : " << (ok? "OK":"FAIL") << "\n";
    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
