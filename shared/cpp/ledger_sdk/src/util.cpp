#include "../include/util.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <random>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <ctime>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string gen_id() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    long long us = duration_cast<microseconds>(tp.time_since_epoch()).count();
    long long secs = us / 1000000;
    long long frac = us % 1000000;
    if (frac < 0) { frac += 1000000; --secs; }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[48];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return std::string(buf);
}

std::string now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& s) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &mon, &day, &sep, &hour, &min, &sec, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != ' ') return std::nullopt;
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    long long micros = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) { micros = micros * 10 + (s[pos] - '0'); ++digits; }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }

    long offset_seconds = 0;
    std::string rest = s.substr(pos);
    if (rest == "Z" || rest == "z") {
        // UTC
    } else if (!rest.empty()) {
        if (rest[0] != '+' && rest[0] != '-') return std::nullopt;
        int oh = 0, om = 0;
        if (rest.size() == 6 && rest[3] == ':') {
            if (std::sscanf(rest.c_str() + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
        } else if (rest.size() == 5) {
            if (std::sscanf(rest.c_str() + 1, "%2d%2d", &oh, &om) != 2) return std::nullopt;
        } else {
            return std::nullopt;
        }
        if (oh > 23 || om > 59) return std::nullopt;
        offset_seconds = (oh * 3600L + om * 60L) * (rest[0] == '-' ? -1 : 1);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(t)
            + std::chrono::microseconds(micros)
            - std::chrono::seconds(offset_seconds);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
}

std::string sha1_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return {};
    SHA_CTX ctx;
    SHA1_Init(&ctx);
    char buf[1 << 16];
    while (f) {
        f.read(buf, sizeof(buf));
        std::streamsize n = f.gcount();
        if (n > 0) SHA1_Update(&ctx, buf, (size_t)n);
    }
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1_Final(md, &ctx);
    std::ostringstream oss;
    for (int i = 0; i < SHA_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::optional<std::string> read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return std::nullopt;
    return ss.str();
}
