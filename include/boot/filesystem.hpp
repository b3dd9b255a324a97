/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * bootd is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * bootd is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with bootd.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file filesystem.hpp
 * @brief This file declares path resolution against the served root.
 */
#pragma once
#ifndef BOOT_FILESYSTEM_HPP
#define BOOT_FILESYSTEM_HPP
#include <filesystem>
#include <fstream>
#include <memory>
#include <string_view>
#include <system_error>
/** @brief For filesystem access under the served root directory. */
namespace boot::filesystem {
/**
 * @brief Normalizes a configured root directory.
 * @param root The configured root. Relative paths are taken from the
 * current working directory.
 * @return The absolute, canonical root without a trailing separator.
 * @throws std::filesystem::filesystem_error if the root can't be examined.
 */
auto root_directory(const std::filesystem::path &root)
    -> std::filesystem::path;

/**
 * @brief Resolves a client supplied name against the root directory.
 * @details Leading separators are stripped from name before it is joined to
 * root and made canonical, following symbolic links for the part of the path
 * that exists. The result is accepted only if it is root itself or lies
 * beneath it, compared component by component. Existence is not checked.
 * @param root A root returned by root_directory().
 * @param name The client supplied name.
 * @param[out] err Cleared on success, set to std::errc::permission_denied if
 * the name escapes root.
 * @returns The resolved path, or an empty path on error.
 */
auto resolve(const std::filesystem::path &root, std::string_view name,
             std::error_code &err) -> std::filesystem::path;

/**
 * @brief Opens a file for reading.
 * @param file The file to open.
 * @param[out] err An error code that is cleared on success and set on error.
 * @returns A shared pointer to an open file stream.
 */
auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::shared_ptr<std::fstream>;
} // namespace boot::filesystem
#endif // BOOT_FILESYSTEM_HPP
