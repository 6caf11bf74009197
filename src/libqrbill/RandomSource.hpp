/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Source of random values for reference generation.
 *
 * Reference generation is the only place the library draws random values.
 * Callers that need reproducible references (tests, replays) pass their own
 * RandomSource; everything else uses processRandomSource().
 */

#pragma once

#include <cstdint>
#include <random>

namespace qr_bill {

class RandomSource
{
  public:
    RandomSource() = default;
    virtual ~RandomSource() = default;

    RandomSource(const RandomSource &) = delete;
    RandomSource &operator=(const RandomSource &) = delete;

    /// Next uniformly distributed 64-bit value
    virtual uint64_t next() = 0;

    /// Next decimal digit, 0..9
    unsigned int nextDigit() { return static_cast<unsigned int>(next() % 10); }
};

/**
 * Mersenne twister backed source. The default constructor seeds from
 * std::random_device, the explicit one gives a reproducible sequence.
 */
class Mt19937RandomSource : public RandomSource
{
  public:
    Mt19937RandomSource();
    explicit Mt19937RandomSource(uint64_t seed);

    uint64_t next() override;

  private:
    std::mt19937_64 m_engine;
};

/**
 * The source used when the caller does not inject one. There is one instance
 * per thread, so concurrent callers never share engine state.
 */
RandomSource &processRandomSource();

} // namespace qr_bill
