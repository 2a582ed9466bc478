/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "CheckpointSerializable.hpp"

#include <cstdint>
#include <random>

//-------------------------------------------------------------------------

class RNG : public std::mt19937, public CheckpointSerializable
{
public:
    explicit RNG(uint64_t seed = std::mt19937::default_seed) noexcept;

    std::mt19937::result_type operator()();

    // Uniform on [0, 1) carrying 53 random bits from two consecutive draws.
    [[nodiscard]] double uniform();

    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] uint64_t callCount() const noexcept { return m_callCount; }

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static RNG fromCheckpoint(const rapidjson::Value& json);

private:
    uint64_t m_callCount{};
    uint64_t m_seed;
};

//-------------------------------------------------------------------------
