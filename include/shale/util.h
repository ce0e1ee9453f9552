#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace shale {

// Random (version 4) hyphenated UUID.
std::string GenerateUuid();

// 16 raw bytes <-> hyphenated text form.
std::string UuidToBytes(const std::string& uuid);
std::string UuidFromBytes(const std::string& bytes);

uint64_t RandomU64();

uint64_t NowNanos();
uint64_t NowMillis();

// Config value parsing; returns false when the key is absent or malformed.
bool ParseConfigU64(const std::map<std::string, std::string>& config,
                    const std::string& key, uint64_t* value);
bool ParseConfigDouble(const std::map<std::string, std::string>& config,
                       const std::string& key, double* value);

} // namespace shale
