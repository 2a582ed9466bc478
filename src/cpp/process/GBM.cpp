/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "GBM.hpp"

#include "NormalDistribution.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

GBM::GBM(double X0, double mu, double sigma, double dt)
    : m_X0{X0},
      m_mu{mu},
      m_sigma{sigma},
      m_dt{dt},
      m_value{X0}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!(X0 > 0.0) || !std::isfinite(X0)) {
        throw std::invalid_argument{fmt::format(
            "{}: initial value must be positive, was {}", ctx, X0)};
    }
    if (!std::isfinite(mu)) {
        throw std::invalid_argument{fmt::format("{}: drift must be finite, was {}", ctx, mu)};
    }
    if (!(sigma >= 0.0) || !std::isfinite(sigma)) {
        throw std::invalid_argument{fmt::format(
            "{}: volatility must be non-negative, was {}", ctx, sigma)};
    }
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw std::invalid_argument{fmt::format("{}: dt must be positive, was {}", ctx, dt)};
    }
}

//-------------------------------------------------------------------------

GBM::GBM(double X0, double mu, double sigma, double dt, uint64_t seed)
    : GBM{X0, mu, sigma, dt}
{
    m_rng = RNG{seed};
}

//-------------------------------------------------------------------------

void GBM::update([[maybe_unused]] Timestamp timestamp)
{
    m_t += m_dt;
    m_W += std::sqrt(m_dt) * equisim::stats::NormalDistribution::standard(m_rng, m_spare);
    m_value = m_X0 * std::exp((m_mu - 0.5 * m_sigma * m_sigma) * m_t + m_sigma * m_W);
    m_valueSignal(m_value);
}

//-------------------------------------------------------------------------

void GBM::reset()
{
    m_t = 0.0;
    m_W = 0.0;
    m_value = m_X0;
}

//-------------------------------------------------------------------------

std::vector<double> GBM::samplePath(size_t steps)
{
    reset();
    std::vector<double> path;
    path.reserve(steps + 1);
    path.push_back(m_value);
    for (Timestamp step = 1; step <= steps; ++step) {
        update(step);
        path.push_back(m_value);
    }
    return path;
}

//-------------------------------------------------------------------------

std::vector<std::vector<double>> GBM::samplePaths(size_t pathCount, size_t steps)
{
    std::vector<std::vector<double>> paths;
    paths.reserve(pathCount);
    for (size_t i = 0; i < pathCount; ++i) {
        paths.push_back(samplePath(steps));
    }
    return paths;
}

//-------------------------------------------------------------------------

void GBM::checkpointSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("name", rapidjson::Value{"GBM", allocator}, allocator);
        m_rng.checkpointSerialize(json, "rng");
        json.AddMember("X0", rapidjson::Value{m_X0}, allocator);
        json.AddMember("mu", rapidjson::Value{m_mu}, allocator);
        json.AddMember("sigma", rapidjson::Value{m_sigma}, allocator);
        json.AddMember("dt", rapidjson::Value{m_dt}, allocator);
        json.AddMember("t", rapidjson::Value{m_t}, allocator);
        json.AddMember("W", rapidjson::Value{m_W}, allocator);
        json.AddMember("value", rapidjson::Value{m_value}, allocator);
        equisim::json::setOptionalMember(json, "spare", m_spare);
    };
    equisim::json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<GBM> GBM::fromXML(pugi::xml_node node, uint64_t seed)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttribute = [&](const char* name) {
        return equisim::util::requireAttribute(node, name, ctx).as_double();
    };

    const double T = getAttribute("T");
    const uint64_t steps = equisim::util::requireAttribute(node, "steps", ctx).as_ullong();
    if (steps == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Attribute 'steps' must be positive", ctx)};
    }

    return std::make_unique<GBM>(
        getAttribute("S0"),
        getAttribute("mu"),
        getAttribute("sigma"),
        T / static_cast<double>(steps),
        seed);
}

//-------------------------------------------------------------------------

std::unique_ptr<GBM> GBM::fromCheckpoint(const rapidjson::Value& json)
{
    auto gbm = std::make_unique<GBM>(
        json["X0"].GetDouble(),
        json["mu"].GetDouble(),
        json["sigma"].GetDouble(),
        json["dt"].GetDouble());
    gbm->m_t = json["t"].GetDouble();
    gbm->m_W = json["W"].GetDouble();
    gbm->m_value = json["value"].GetDouble();
    gbm->m_rng = RNG::fromCheckpoint(json["rng"]);
    if (const auto& spare = json["spare"]; !spare.IsNull()) {
        gbm->m_spare = spare.GetDouble();
    }
    return gbm;
}

//-------------------------------------------------------------------------

PathEnsemble makePathEnsemble(GBM& gbm, size_t steps, size_t pathCount)
{
    PathEnsemble ensemble;
    ensemble.time = views::iota(0uz, steps + 1)
        | views::transform([&](size_t i) { return static_cast<double>(i) * gbm.dt(); })
        | ranges::to<std::vector>();
    ensemble.paths = gbm.samplePaths(pathCount, steps);
    return ensemble;
}

//-------------------------------------------------------------------------
