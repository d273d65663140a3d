/**
 * @file arena.hpp
 * @brief generational slot arena + typed handles for nodes/elements/loads uwu
 *
 * the structure owns every node, element, and load in one of these arenas.
 * other records refer to entries by Handle (slot index + generation), never by
 * pointer, so there is no cyclic ownership and removal cannot dangle anything:
 * erasing a slot bumps its generation, which turns every outstanding handle to
 * it into a miss even after the slot gets recycled.
 *
 * slots live in one contiguous vector indexed in parallel by the integrator, so
 * the hot loop walks memory linearly and never allocates.
 *
 * @author TrussFlex contributors
 * @date 2026-10-06
 * @version 0.1
 *
 * @note header-only, C++26 (-std=c++2c), zero dependencies beyond the standard library
 */
#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tfx::common
{

/**
 * @brief strongly typed (index, generation) handle
 *
 * @tparam Tag empty struct making NodeId/ElementId/LoadId incompatible types
 */
template <typename Tag>
struct Handle
{
    std::uint32_t index{std::numeric_limits<std::uint32_t>::max()};
    std::uint32_t generation{0U};

    auto operator<=>(const Handle &) const = default;
};

/**
 * @brief breadcrumb-friendly rendering ("node[3:1]")
 */
template <typename Tag>
[[nodiscard]] auto describe(std::string_view kind, Handle<Tag> handle) -> std::string
{
    return std::format("{}[{}:{}]", kind, handle.index, handle.generation);
}

/**
 * @brief slot arena with free-list reuse and generation checks
 *
 * @tparam T stored record type
 * @tparam Tag handle tag
 */
template <typename T, typename Tag>
class SlotArena
{
public:
    using HandleType = Handle<Tag>;

    /**
     * @brief store @p value and hand back a fresh handle
     *
     * ⚠️ IMPURE FUNCTION (mutates the arena, may grow the slot vector)
     */
    [[nodiscard]] auto insert(T value) -> HandleType
    {
        std::uint32_t index{};
        if (!free_list_.empty())
        {
            index = free_list_.back();
            free_list_.pop_back();
        }
        else
        {
            index = static_cast<std::uint32_t>(slots_.size());
            slots_.emplace_back();
        }
        auto &slot = slots_[index];
        slot.value = std::move(value);
        ++live_;
        return HandleType{index, slot.generation};
    }

    /**
     * @brief drop the entry behind @p handle; false when the handle is stale
     */
    auto erase(HandleType handle) -> bool
    {
        if (!contains(handle))
        {
            return false;
        }
        auto &slot = slots_[handle.index];
        slot.value.reset();
        ++slot.generation;
        free_list_.push_back(handle.index);
        --live_;
        return true;
    }

    [[nodiscard]] auto contains(HandleType handle) const noexcept -> bool
    {
        return handle.index < slots_.size() && slots_[handle.index].generation == handle.generation &&
               slots_[handle.index].value.has_value();
    }

    [[nodiscard]] auto get(HandleType handle) noexcept -> T *
    {
        return contains(handle) ? &*slots_[handle.index].value : nullptr;
    }

    [[nodiscard]] auto get(HandleType handle) const noexcept -> const T *
    {
        return contains(handle) ? &*slots_[handle.index].value : nullptr;
    }

    /**
     * @brief remove every entry; generations keep counting so old handles stay dead
     */
    void clear()
    {
        free_list_.clear();
        for (std::size_t i = slots_.size(); i > 0U; --i)
        {
            auto &slot = slots_[i - 1U];
            if (slot.value.has_value())
            {
                slot.value.reset();
                ++slot.generation;
            }
            free_list_.push_back(static_cast<std::uint32_t>(i - 1U));
        }
        live_ = 0U;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return live_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return live_ == 0U; }

    /// number of slots (live or free), the bound for parallel scratch arrays
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return slots_.size(); }

    /**
     * @brief visit every live entry in slot order as (handle, value&)
     */
    template <typename Fn>
    void for_each(Fn &&fn)
    {
        for (std::size_t i = 0; i < slots_.size(); ++i)
        {
            auto &slot = slots_[i];
            if (slot.value.has_value())
            {
                fn(HandleType{static_cast<std::uint32_t>(i), slot.generation}, *slot.value);
            }
        }
    }

    template <typename Fn>
    void for_each(Fn &&fn) const
    {
        for (std::size_t i = 0; i < slots_.size(); ++i)
        {
            const auto &slot = slots_[i];
            if (slot.value.has_value())
            {
                fn(HandleType{static_cast<std::uint32_t>(i), slot.generation}, *slot.value);
            }
        }
    }

    /**
     * @brief live handles in slot order (allocates, not for the step loop)
     */
    [[nodiscard]] auto handles() const -> std::vector<HandleType>
    {
        std::vector<HandleType> out;
        out.reserve(live_);
        for_each([&out](HandleType handle, const T &) { out.push_back(handle); });
        return out;
    }

private:
    struct Slot
    {
        std::optional<T> value{};
        std::uint32_t    generation{0U};
    };

    std::vector<Slot>          slots_{};
    std::vector<std::uint32_t> free_list_{};
    std::size_t                live_{0U};
};

} // namespace tfx::common
