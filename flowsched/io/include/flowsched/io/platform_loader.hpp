#pragma once

/// @file platform_loader.hpp
/// @brief Loading the resource pool from JSON.
/// @ingroup io_loaders

#include <flowsched/core/engine.hpp>

#include <filesystem>
#include <string_view>

namespace flowsched::io {

/// @brief Load a resource pool from a JSON file.
///
/// Expected layout:
/// @code
/// {"resources": [{"id": 0, "mips": 1000, "cores": 2, "ram_mb": 2048, "mobile": false}]}
/// @endcode
/// `cores` defaults to 1, `ram_mb` to 0 and `mobile` to false.
///
/// @note Does **not** call `Engine::finalize()`; the workflow still has to
///       be injected.
///
/// @throws LoaderError  If the file cannot be read or the content is invalid.
/// @see load_platform_from_string
void load_platform(core::Engine& engine, const std::filesystem::path& path);

/// @brief Load a resource pool from a JSON string.
/// @throws LoaderError  If the JSON is malformed or fails validation.
/// @see load_platform
void load_platform_from_string(core::Engine& engine, std::string_view json);

} // namespace flowsched::io
