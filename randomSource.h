#pragma once
#include <cstdint>
#include <mutex>
#include <random>

// uniform random handle shared by the generator and the controller.
// implementations lock internally, callers never have to.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // next fraction in [0,1)
    virtual double nextDouble() = 0;

    // next integer in [min,max); returns min when the range is empty
    virtual int nextInt(int min, int max) = 0;
};

// OS entropy (std::random_device), used for live play
class SystemRandomSource : public RandomSource {
private:
    std::mutex mtx;
    std::random_device device;

public:
    SystemRandomSource() = default;

    double nextDouble() override;
    int nextInt(int min, int max) override;
};

// deterministic stream for tests and reproducible simulation blocks
class SeededRandomSource : public RandomSource {
private:
    std::mutex mtx;
    std::mt19937_64 engine;

public:
    explicit SeededRandomSource(std::uint64_t seed);

    double nextDouble() override;
    int nextInt(int min, int max) override;
};
