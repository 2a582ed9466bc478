/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace equisim::stats
{

//-------------------------------------------------------------------------

// Equal-width bins over [lo, hi]. All bins are half-open except the last,
// which also takes hi. Values outside the range are tallied separately and
// still count towards total(), so densities of a clipped histogram remain
// comparable to the underlying pdf.
class Histogram
{
public:
    Histogram(double lo, double hi, std::size_t binCount);

    void add(double x) noexcept;
    void add(std::span<const double> xs) noexcept;

    [[nodiscard]] std::size_t binCount() const noexcept { return m_counts.size(); }
    [[nodiscard]] double lo() const noexcept { return m_lo; }
    [[nodiscard]] double hi() const noexcept { return m_hi; }
    [[nodiscard]] double binWidth() const noexcept { return m_width; }
    [[nodiscard]] double binLow(std::size_t i) const noexcept { return m_lo + i * m_width; }
    [[nodiscard]] double binHigh(std::size_t i) const noexcept;
    [[nodiscard]] double binCenter(std::size_t i) const noexcept { return binLow(i) + 0.5 * m_width; }

    [[nodiscard]] uint64_t count(std::size_t i) const { return m_counts.at(i); }
    [[nodiscard]] const std::vector<uint64_t>& counts() const noexcept { return m_counts; }
    [[nodiscard]] uint64_t underflow() const noexcept { return m_underflow; }
    [[nodiscard]] uint64_t overflow() const noexcept { return m_overflow; }
    [[nodiscard]] uint64_t total() const noexcept { return m_total; }

    [[nodiscard]] double density(std::size_t i) const;

    [[nodiscard]] std::string render(std::size_t width = 60) const;

    [[nodiscard]] static Histogram fromSamples(
        std::span<const double> samples,
        std::size_t binCount,
        std::optional<std::pair<double, double>> range = {});

private:
    double m_lo, m_hi, m_width;
    std::vector<uint64_t> m_counts;
    uint64_t m_underflow{}, m_overflow{}, m_total{};
};

//-------------------------------------------------------------------------

}  // namespace equisim::stats

//-------------------------------------------------------------------------
