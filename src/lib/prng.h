/*
 * Small pseudorandom number generator with convenience distributions.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdint.h>
#include <random>


class PRNG
{
public:
    PRNG() : engine(42) {}

    void seed(uint32_t s);

    uint32_t uniform32();

    // Float in [0, 1)
    float uniform();

    // Float in [a, b)
    float uniform(float a, float b);

    // Integer in [0, n). Returns 0 when n is 0.
    unsigned index(unsigned n);

private:
    std::mt19937 engine;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline void PRNG::seed(uint32_t s)
{
    engine.seed(s);
}

inline uint32_t PRNG::uniform32()
{
    return engine();
}

inline float PRNG::uniform()
{
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(engine);
}

inline float PRNG::uniform(float a, float b)
{
    return a + (b - a) * uniform();
}

inline unsigned PRNG::index(unsigned n)
{
    if (n == 0) {
        return 0;
    }
    return std::uniform_int_distribution<unsigned>(0, n - 1)(engine);
}
