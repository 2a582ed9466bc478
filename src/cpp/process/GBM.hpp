/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Process.hpp"
#include "RNG.hpp"
#include "common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

// Geometric Brownian motion dX = mu X dt + sigma X dW, sampled exactly on a
// grid of step dt:
//   X(t) = X0 exp((mu - sigma^2 / 2) t + sigma W(t)).
class GBM : public Process
{
public:
    GBM(double X0, double mu, double sigma, double dt);
    GBM(double X0, double mu, double sigma, double dt, uint64_t seed);

    virtual double value() const override { return m_value; }

    virtual void update(Timestamp timestamp) override;
    virtual void reset() override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] std::vector<double> samplePath(size_t steps);
    [[nodiscard]] std::vector<std::vector<double>> samplePaths(size_t pathCount, size_t steps);

    [[nodiscard]] double X0() const noexcept { return m_X0; }
    [[nodiscard]] double dt() const noexcept { return m_dt; }
    [[nodiscard]] double t() const noexcept { return m_t; }
    [[nodiscard]] const RNG& rng() const noexcept { return m_rng; }

    [[nodiscard]] static std::unique_ptr<GBM> fromXML(pugi::xml_node node, uint64_t seed);
    [[nodiscard]] static std::unique_ptr<GBM> fromCheckpoint(const rapidjson::Value& json);

private:
    RNG m_rng;
    double m_X0, m_mu, m_sigma, m_dt;
    double m_t{}, m_W{};
    std::optional<double> m_spare;
    double m_value;
};

//-------------------------------------------------------------------------

struct PathEnsemble
{
    std::vector<double> time;
    std::vector<std::vector<double>> paths;
};

// pathCount consecutive paths of the given number of steps, with their time grid.
[[nodiscard]] PathEnsemble makePathEnsemble(GBM& gbm, size_t steps, size_t pathCount);

//-------------------------------------------------------------------------
