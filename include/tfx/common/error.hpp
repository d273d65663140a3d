/**
 * @file error.hpp
 * @brief core error payload shared by structure edits, recorder, and session uwu
 *
 * the core never throws. every edit that can be rejected returns std::expected
 * with this struct so the editing layer can show a reason and retry. rejected
 * operations never leave partial mutations behind (all-or-nothing edits).
 *
 * @author TrussFlex contributors
 * @date 2026-10-05
 * @version 0.1
 *
 * @note std::expected needs GCC 15.2+ with -std=c++2c
 */
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tfx
{

/**
 * @brief closed taxonomy of recoverable core rejections
 */
enum class ErrorCode : std::uint8_t
{
    DegenerateElement,     ///< element would connect a node to itself or a coincident node
    InvalidReference,      ///< handle names a node/element/load that is not alive
    InvalidOperationState, ///< operation not allowed in the current run/record state
    InvalidArgument        ///< value outside its domain (negative mass, bad preset index, ...)
};

/**
 * @brief error payload with a breadcrumb trail (same vibe as config errors)
 */
struct CoreError
{
    ErrorCode                code;    ///< machine-checkable category
    std::string              message; ///< human-readable reason
    std::vector<std::string> context; ///< breadcrumbs ("remove_node", "node[3:1]", ...)
};

template <typename T>
using Result = std::expected<T, CoreError>;

using Status = std::expected<void, CoreError>;

/**
 * @brief stable name for logs and test failure messages
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto to_string(ErrorCode code) noexcept -> std::string_view
{
    switch (code)
    {
    case ErrorCode::DegenerateElement:
        return "DegenerateElement";
    case ErrorCode::InvalidReference:
        return "InvalidReference";
    case ErrorCode::InvalidOperationState:
        return "InvalidOperationState";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

/**
 * @brief build an unexpected CoreError in one line
 */
[[nodiscard]] inline auto make_error(ErrorCode code, std::string message, std::vector<std::string> ctx = {})
    -> std::unexpected<CoreError>
{
    return std::unexpected(CoreError{code, std::move(message), std::move(ctx)});
}

} // namespace tfx
