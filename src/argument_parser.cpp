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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "boot/detail/argument_parser.hpp"

#include <algorithm>
namespace boot::detail {

/** @brief Returns true if the token is a run of dashes ("-" or "--"). */
static inline auto is_dashes(std::string_view token) noexcept -> bool
{
  // NOLINTNEXTLINE(readability-identifier-length)
  return std::ranges::all_of(token, [](char ch) { return ch == '-'; });
}

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>();
  auto opt = option{};
  auto pending = false;

  for (const auto *arg : args.subspan(std::min<std::size_t>(1, args.size())))
  {
    auto token = std::string_view(arg);
    if (!token.empty() && token[0] == '-')
    {
      if (pending)
        options.push_back(opt);

      opt = option{.flag = token};
      pending = true;

      if (token.size() > 2 && token[1] == '-') // long option.
      {
        auto delim = std::ranges::find(token, '=');
        if (delim != token.cend())
        {
          opt.flag = {token.cbegin(), delim};
          // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          opt.value = {++delim, token.cend()};
          options.push_back(opt);
          pending = false;
        }
      }
      continue;
    }

    // A bare "-" or "--" takes no value.
    if (pending && !is_dashes(opt.flag))
    {
      opt.value = token;
      options.push_back(opt);
      pending = false;
      continue;
    }

    if (pending)
      options.push_back(opt);

    options.push_back(option{.value = token});
    pending = false;
  }

  if (pending)
    options.push_back(opt);

  return options;
}
} // namespace boot::detail
