/**
 * @file presets.cpp
 * @brief preset geometry constants and builders uwu
 */
#include "tfx/sim/presets.hpp"

#include <string>
#include <vector>

namespace tfx::sim
{
namespace
{

using physics::materials::MaterialKind;

constexpr double      kWarrenPanel  = 4.0; // bottom chord panel length [m]
constexpr double      kWarrenHeight = 3.0;
constexpr std::size_t kWarrenPanels = 5U;

constexpr double      kArchSpan   = 20.0;
constexpr double      kArchRise   = 6.0; // parabolic rib crown height [m]
constexpr std::size_t kArchPanels = 8U;

constexpr double      kBeamSegment  = 2.0;
constexpr std::size_t kBeamSegments = 5U;

/**
 * @brief connect helper that keeps the first failure
 */
class Builder
{
public:
    explicit Builder(model::Structure &structure) : structure_{structure} {}

    auto node(double x, double y, bool fixed = false) -> model::NodeId
    {
        return structure_.add_node({x, y}, fixed);
    }

    void member(model::NodeId a, model::NodeId b, MaterialKind material)
    {
        if (!status_)
        {
            return;
        }
        if (auto element = structure_.add_element(a, b, material); !element)
        {
            status_ = std::unexpected(element.error());
        }
    }

    [[nodiscard]] auto status() const -> const Status & { return status_; }

private:
    model::Structure &structure_;
    Status            status_{};
};

void build_warren(Builder &builder)
{
    std::vector<model::NodeId> bottom;
    std::vector<model::NodeId> top;
    for (std::size_t i = 0; i <= kWarrenPanels; ++i)
    {
        const bool support = (i == 0U || i == kWarrenPanels);
        bottom.push_back(builder.node(static_cast<double>(i) * kWarrenPanel, 0.0, support));
    }
    for (std::size_t i = 0; i < kWarrenPanels; ++i)
    {
        top.push_back(builder.node((static_cast<double>(i) + 0.5) * kWarrenPanel, -kWarrenHeight));
    }

    for (std::size_t i = 0; i < kWarrenPanels; ++i)
    {
        builder.member(bottom[i], bottom[i + 1U], MaterialKind::Road);
    }
    for (std::size_t i = 0; i + 1U < kWarrenPanels; ++i)
    {
        builder.member(top[i], top[i + 1U], MaterialKind::Steel);
    }
    for (std::size_t i = 0; i < kWarrenPanels; ++i)
    {
        builder.member(bottom[i], top[i], MaterialKind::Steel);
        builder.member(top[i], bottom[i + 1U], MaterialKind::Steel);
    }
}

void build_arch(Builder &builder)
{
    const double panel = kArchSpan / static_cast<double>(kArchPanels);
    const double half  = 0.5 * kArchSpan;

    std::vector<model::NodeId> deck;
    for (std::size_t i = 0; i <= kArchPanels; ++i)
    {
        const bool support = (i == 0U || i == kArchPanels);
        deck.push_back(builder.node(static_cast<double>(i) * panel, 0.0, support));
    }

    // rib[j] sits above deck[j]; rib[0] and rib[kArchPanels] are the deck supports
    std::vector<model::NodeId> rib(kArchPanels + 1U);
    rib.front() = deck.front();
    rib.back()  = deck.back();
    for (std::size_t j = 1; j < kArchPanels; ++j)
    {
        const double x = static_cast<double>(j) * panel;
        const double u = (x - half) / half;
        rib[j]         = builder.node(x, -kArchRise * (1.0 - u * u));
    }

    for (std::size_t i = 0; i < kArchPanels; ++i)
    {
        builder.member(deck[i], deck[i + 1U], MaterialKind::Road);
    }
    for (std::size_t j = 0; j < kArchPanels; ++j)
    {
        builder.member(rib[j], rib[j + 1U], MaterialKind::Steel);
    }
    for (std::size_t j = 1; j < kArchPanels; ++j)
    {
        builder.member(rib[j], deck[j], MaterialKind::Wood);
    }
    for (std::size_t j = 1; j + 1U < kArchPanels; ++j)
    {
        builder.member(rib[j], deck[j + 1U], MaterialKind::Wood);
    }
}

// deck only, no superstructure: sags, yields and breaks under self-weight
void build_simple_beam(Builder &builder)
{
    std::vector<model::NodeId> deck;
    for (std::size_t i = 0; i <= kBeamSegments; ++i)
    {
        const bool support = (i == 0U || i == kBeamSegments);
        deck.push_back(builder.node(static_cast<double>(i) * kBeamSegment, 0.0, support));
    }
    for (std::size_t i = 0; i < kBeamSegments; ++i)
    {
        builder.member(deck[i], deck[i + 1U], MaterialKind::Road);
    }
}

} // namespace

auto build_preset(model::Structure &structure, Preset preset) -> Status
{
    structure.clear();
    Builder builder{structure};
    switch (preset)
    {
    case Preset::WarrenTruss:
        build_warren(builder);
        break;
    case Preset::Arch:
        build_arch(builder);
        break;
    case Preset::SimpleBeam:
        build_simple_beam(builder);
        break;
    }
    if (!builder.status())
    {
        auto err = builder.status().error();
        err.context.insert(err.context.begin(), std::string{preset_name(preset)});
        structure.clear();
        return std::unexpected(std::move(err));
    }
    return {};
}

} // namespace tfx::sim
