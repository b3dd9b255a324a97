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
 * @file filesystem.cpp
 * @brief This file implements path resolution against the served root.
 */
#include "boot/filesystem.hpp"

#include <algorithm>
namespace boot::filesystem {

auto root_directory(const std::filesystem::path &root)
    -> std::filesystem::path
{
  auto path = std::filesystem::weakly_canonical(std::filesystem::absolute(root));
  // "/srv/boot/" normalizes with an empty final element.
  if (!path.has_filename() && path != path.root_path())
    path = path.parent_path();

  return path;
}

auto resolve(const std::filesystem::path &root, std::string_view name,
             std::error_code &err) -> std::filesystem::path
{
  err.clear();

  const auto start = name.find_first_not_of('/');
  name.remove_prefix(std::min(start, name.size()));

  // Follows symbolic links in the part of the path that exists.
  auto candidate = std::filesystem::weakly_canonical(root / name, err);
  if (err)
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  const auto relative = candidate.lexically_relative(root);
  if (relative.empty() || *relative.begin() == "..")
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return candidate;
}

auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::shared_ptr<std::fstream>
{
  err.clear();
  auto fstream =
      std::make_shared<std::fstream>(file, std::ios::in | std::ios::binary);
  if (!fstream->is_open())
  {
    if (!std::filesystem::exists(file, err))
    {
      err = std::make_error_code(std::errc::no_such_file_or_directory);
      return {};
    }

    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return fstream;
}

} // namespace boot::filesystem
