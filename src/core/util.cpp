#include <shale/util.h>

#include <chrono>
#include <cstdio>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

namespace shale {

namespace {

std::mt19937_64& Engine() {
    static std::mt19937_64 engine(std::random_device{}());
    return engine;
}

std::mutex& EngineMutex() {
    static std::mutex mutex;
    return mutex;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

uint64_t RandomU64() {
    std::lock_guard<std::mutex> lock(EngineMutex());
    return Engine()();
}

std::string GenerateUuid() {
    uint64_t hi = RandomU64();
    uint64_t lo = RandomU64();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string UuidToBytes(const std::string& uuid) {
    std::string bytes;
    int high = -1;
    for (char c : uuid) {
        int v = HexValue(c);
        if (v < 0) continue;
        if (high < 0) {
            high = v;
        } else {
            bytes.push_back(static_cast<char>((high << 4) | v));
            high = -1;
        }
    }
    return bytes;
}

std::string UuidFromBytes(const std::string& bytes) {
    static const char* kHex = "0123456789abcdef";
    std::string text;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) text.push_back('-');
        auto b = static_cast<uint8_t>(bytes[i]);
        text.push_back(kHex[b >> 4]);
        text.push_back(kHex[b & 0xF]);
    }
    return text;
}

uint64_t NowNanos() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

uint64_t NowMillis() {
    return NowNanos() / 1000000ULL;
}

bool ParseConfigU64(const std::map<std::string, std::string>& config,
                    const std::string& key, uint64_t* value) {
    auto it = config.find(key);
    if (it == config.end()) return false;
    if (it->second.empty() || it->second[0] == '-' || it->second[0] == '+') return false;
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(it->second, &pos);
        if (pos != it->second.size()) return false;
        *value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseConfigDouble(const std::map<std::string, std::string>& config,
                       const std::string& key, double* value) {
    auto it = config.find(key);
    if (it == config.end()) return false;
    try {
        size_t pos = 0;
        double parsed = std::stod(it->second, &pos);
        if (pos != it->second.size()) return false;
        *value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace shale
