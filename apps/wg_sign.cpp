// SPDX-License-Identifier: Apache-2.0
// Part of WebhookGate (WG) project.
// apps/wg_sign.cpp
//
// Prints the X-Hub-Signature-256 value for a payload, e.g.
//   curl -H "X-Hub-Signature-256: $(wg_sign --file body.json)" --data-binary @body.json ...

#include "wg/internal/signature.hpp"
#include "wg/server_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0 << " [--secret <s>] [--file <payload>]\n"
      "  --secret   shared secret (default: $WEBHOOK_SECRET)\n"
      "  --file     payload file, read verbatim (default: stdin)\n";
}

int main(int argc, char** argv) {
    std::string secret, file;
    bool have_secret = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--secret" && i+1 < argc) { secret = argv[++i]; have_secret = true; }
        else if (a == "--file" && i+1 < argc) file = argv[++i];
        else { usage(argv[0]); return 2; }
    }

    if (!have_secret) {
        const char* env = std::getenv(wg::kEnvSecret);
        if (env) secret = env;
    }
    if (secret.empty()) {
        std::cerr << "No secret: pass --secret or set " << wg::kEnvSecret << "\n";
        return 2;
    }

    std::string payload;
    if (file.empty()) {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        payload = ss.str();
    } else {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            std::cerr << "Failed to open " << file << " for reading\n";
            return 2;
        }
        payload.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    const std::string header = wg::internal::make_signature_header(secret, payload);
    if (header.empty()) {
        std::cerr << "HMAC computation failed\n";
        return 1;
    }
    std::cout << header << "\n";
    return 0;
}
