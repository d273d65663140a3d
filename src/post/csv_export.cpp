/**
 * @file csv_export.cpp
 * @brief element table + time-history CSV serialization uwu
 */
#include "tfx/post/csv_export.hpp"

#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include "tfx/common/log.hpp"
#include "tfx/physics/materials.hpp"

namespace tfx::post
{
namespace
{

constexpr std::string_view kPostLogTag = "[tfx::post]";

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> ExportError
{
    ExportError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

[[nodiscard]] auto make_stream() -> std::ostringstream
{
    std::ostringstream oss;
    oss.precision(9);
    return oss;
}

[[nodiscard]] auto write_text(const std::filesystem::path &path, const std::string &text)
    -> std::expected<void, ExportError>
{
    if (!path.parent_path().empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return std::unexpected(
                make_error("failed to create export directory: " + ec.message(), {path.parent_path().string()}));
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file)
    {
        return std::unexpected(make_error("failed to open CSV for writing", {path.string()}));
    }
    file << text;
    if (!file)
    {
        return std::unexpected(make_error("failed while writing CSV", {path.string()}));
    }
    log::info(kPostLogTag, "wrote {} ({} bytes)", path.string(), text.size());
    return {};
}

} // namespace

auto format_element_table(const model::Structure &structure) -> std::string
{
    auto oss = make_stream();
    oss << "ID,Material,Yielded,Broken,Stress_Pa,Strain,Force_N,Length_m,Mass_kg,Density,Modulus_Pa,Area_m2,"
           "Yield_Pa,Ultimate_Pa\n";

    const auto &nodes = structure.nodes();
    structure.elements().for_each([&](model::ElementId id, const model::Element &element) {
        const auto &props    = element.properties();
        const auto  measured = element.measure(nodes.get(element.node_a())->position,
                                               nodes.get(element.node_b())->position);
        oss << id.index << ',' << physics::materials::name(element.material()) << ','
            << (element.yielded() ? "true" : "false") << ',' << (element.broken() ? "true" : "false") << ','
            << measured.stress << ',' << measured.strain << ',' << measured.axial_force << ','
            << measured.length << ',' << element.mass() << ',' << props.density << ','
            << props.youngs_modulus << ',' << props.cross_section_area << ',' << props.yield_strength << ','
            << props.ultimate_strength << '\n';
    });
    return oss.str();
}

auto format_recording(const Recording &recording) -> std::string
{
    auto oss = make_stream();
    oss << "Time_s";
    if (recording.mode == RecordingMode::NodeDisplacement)
    {
        oss << ",Displacement_m";
    }
    else
    {
        // same slot index as the element table ID column
        for (const auto column : recording.columns)
        {
            oss << ",E" << column.index;
        }
    }
    oss << '\n';

    for (std::size_t row = 0; row < recording.samples.size(); ++row)
    {
        oss << recording.time_at(row);
        for (const auto value : recording.samples[row])
        {
            oss << ',' << value;
        }
        oss << '\n';
    }
    return oss.str();
}

auto write_element_table(const std::filesystem::path &path, const model::Structure &structure)
    -> std::expected<void, ExportError>
{
    return write_text(path, format_element_table(structure));
}

auto write_recording(const std::filesystem::path &path, const Recording &recording)
    -> std::expected<void, ExportError>
{
    return write_text(path, format_recording(recording));
}

} // namespace tfx::post
