#include "../include/util.hpp"
#include <openssl/sha.h>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <random>
#include <sstream>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        return def;
    }
}

std::string gen_id(const std::string& prefix) {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return prefix + std::string(buf);
}

std::string sha1_hex(const std::string& data) {
    SHA_CTX ctx;
    SHA1_Init(&ctx);
    SHA1_Update(&ctx, data.data(), data.size());
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1_Final(md, &ctx);
    std::ostringstream oss;
    for (int i = 0; i < SHA_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> out;
    std::string cur;
    bool in_token = false;
    char quote = 0;
    for (char c : command) {
        if (quote) {
            if (c == quote) quote = 0;
            else cur.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) { out.push_back(cur); cur.clear(); in_token = false; }
        } else {
            cur.push_back(c);
            in_token = true;
        }
    }
    if (in_token) out.push_back(cur);
    return out;
}

std::string tail_lines(const std::filesystem::path& p, int max_lines) {
    std::ifstream f(p);
    if (!f) return {};
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(f, line)) {
        lines.push_back(line);
        if ((int)lines.size() > max_lines) lines.pop_front();
    }
    std::string out;
    for (const auto& l : lines) {
        if (!out.empty()) out += "\n";
        out += l;
    }
    return out;
}
