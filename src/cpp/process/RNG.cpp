/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "RNG.hpp"

//-------------------------------------------------------------------------

RNG::RNG(uint64_t seed) noexcept
    : std::mt19937{static_cast<std::mt19937::result_type>(seed)}, m_seed{seed}
{}

//-------------------------------------------------------------------------

std::mt19937::result_type RNG::operator()()
{
    ++m_callCount;
    return std::mt19937::operator()();
}

//-------------------------------------------------------------------------

double RNG::uniform()
{
    const uint32_t a = (*this)() >> 5;
    const uint32_t b = (*this)() >> 6;
    return (a * 67108864.0 + b) / 9007199254740992.0;
}

//-------------------------------------------------------------------------

void RNG::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("callCount", rapidjson::Value{m_callCount}, allocator);
        json.AddMember("seed", rapidjson::Value{m_seed}, allocator);
    };
    equisim::json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

RNG RNG::fromCheckpoint(const rapidjson::Value& json)
{
    RNG rng{json["seed"].GetUint64()};
    rng.m_callCount = json["callCount"].GetUint64();
    rng.discard(rng.m_callCount);
    return rng;
}

//-------------------------------------------------------------------------
