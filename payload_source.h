#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <random>

// Pseudorandom filler for transfer payloads. One instance per session, not thread-safe.
class PayloadSource {
public:
    PayloadSource() : engine_(std::random_device{}()) {}

    explicit PayloadSource(uint64_t seed) : engine_(seed) {}

    void fill(unsigned char* out, size_t len) {
        size_t i = 0;
        while (i + sizeof(uint64_t) <= len) {
            uint64_t word = engine_();
            std::memcpy(out + i, &word, sizeof(word));
            i += sizeof(word);
        }
        if (i < len) {
            uint64_t word = engine_();
            std::memcpy(out + i, &word, len - i);
        }
    }

private:
    std::mt19937_64 engine_;
};
