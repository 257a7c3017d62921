/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/utils.hpp"
#include <cctype>
#include <openssl/crypto.h>

namespace wg::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

bool hex_to_bytes(const std::string& hex, std::string& out){
    if(hex.size() % 2) return false;
    std::string tmp;
    tmp.reserve(hex.size()/2);
    for(std::size_t i=0;i<hex.size(); i+=2){
        int h=hexval(hex[i]); int l=hexval(hex[i+1]);
        if(h<0 || l<0) return false;
        tmp.push_back((char)((h<<4)|l));
    }
    out.swap(tmp);
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

bool is_printable_ascii(const std::string& s){
    for(unsigned char c: s){
        if(c < 0x20 || c > 0x7E) return false;
    }
    return true;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

} // namespace wg::internal
