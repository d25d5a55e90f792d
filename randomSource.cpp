#include "randomSource.h"

double SystemRandomSource::nextDouble() {
    std::lock_guard<std::mutex> lock(mtx);
    // 53 random bits -> [0,1)
    std::uint64_t hi = device();
    std::uint64_t lo = device();
    std::uint64_t bits = ((hi << 32) | (lo & 0xffffffffULL)) >> 11;
    return static_cast<double>(bits) * (1.0 / 9007199254740992.0);
}

int SystemRandomSource::nextInt(int min, int max) {
    if (min >= max) return min;
    std::lock_guard<std::mutex> lock(mtx);
    std::uniform_int_distribution<int> dist(min, max - 1);
    return dist(device);
}

SeededRandomSource::SeededRandomSource(std::uint64_t seed) :
    engine(seed) {}

double SeededRandomSource::nextDouble() {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<double>(engine() >> 11) * (1.0 / 9007199254740992.0);
}

int SeededRandomSource::nextInt(int min, int max) {
    if (min >= max) return min;
    std::lock_guard<std::mutex> lock(mtx);
    std::uniform_int_distribution<int> dist(min, max - 1);
    return dist(engine);
}
