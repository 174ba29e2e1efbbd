#include "../include/util.hpp"
#include <openssl/evp.h>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v && *v ? std::string(v) : def;
}

int getenv_int(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try { return std::stoi(v); } catch (const std::exception&) { return def; }
}

double getenv_double(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try { return std::stod(v); } catch (const std::exception&) { return def; }
}

std::string sha1_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + p.string());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("sha1: digest init failed");
    }
    std::vector<char> chunk(64 * 1024);
    while (in.read(chunk.data(), (std::streamsize)chunk.size()) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), chunk.data(), (size_t)in.gcount()) != 1) {
            throw std::runtime_error("sha1: digest update failed for " + p.string());
        }
    }
    if (in.bad()) throw std::runtime_error("read error on " + p.string());

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) throw std::runtime_error("sha1: digest final failed");
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += digits[md[i] >> 4];
        hex += digits[md[i] & 0x0F];
    }
    return hex;
}

std::string gen_session_id() {
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<uint32_t> dist;
    char buf[9];
    snprintf(buf, sizeof(buf), "%08x", dist(rng));
    return "session_" + file_timestamp() + "_" + buf;
}

std::string file_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}
