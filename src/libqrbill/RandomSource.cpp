/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include "RandomSource.hpp"

namespace qr_bill {

Mt19937RandomSource::Mt19937RandomSource()
{
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    m_engine.seed(seq);
}

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed) : m_engine(seed) {}

uint64_t Mt19937RandomSource::next() { return m_engine(); }

RandomSource &processRandomSource()
{
    thread_local Mt19937RandomSource source;
    return source;
}

} // namespace qr_bill
