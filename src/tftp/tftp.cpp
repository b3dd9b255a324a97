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
 * @file tftp.cpp
 * @brief This file defines the TFTP session transitions.
 */
#include "boot/tftp/tftp.hpp"
#include "boot/filesystem.hpp"

#include <array>
namespace boot::tftp {
/**
 * @brief Prepares the next DATA block of a transfer.
 * @details The block number is incremented (wrapping from 65535 to 0) and up
 * to messages::DATALEN bytes are read from the current file position into a
 * freshly framed DATA packet in the session buffer. A short read, including a
 * zero length read at end of file, marks the final block.
 * @param siter An iterator pointing to the current session.
 * @return 0 on success, messages::SERVER_ERROR if the file can't be read.
 */
static inline auto send_next(iterator_t siter) -> std::uint16_t
{
  auto &[key, session] = *siter;
  auto &state = session.state;

  state.block_num += 1; // block_num wraps on overflow.

  auto read_buf = std::array<char, messages::DATALEN>();
  state.file->read(read_buf.data(),
                   static_cast<std::streamsize>(read_buf.size()));
  if (state.file->bad()) [[unlikely]]
    return messages::SERVER_ERROR;

  encode_data(state.buffer, state.block_num,
              std::span(read_buf.data(),
                        static_cast<std::size_t>(state.file->gcount())));
  return 0;
}

auto handle_request(const messages::request &req,
                    const std::filesystem::path &root,
                    iterator_t siter) -> std::uint16_t
{
  using enum messages::error_t;

  auto &[key, session] = *siter;
  auto &state = session.state;
  state.status = session::ABORTED;

  if (to_mode(req.mode) != messages::OCTET)
    return UNSUPPORTED_MODE;

  auto err = std::error_code();
  state.target = filesystem::resolve(root, req.filename, err);
  if (err)
    return ACCESS_VIOLATION;

  if (!std::filesystem::is_regular_file(state.target, err))
    return FILE_NOT_FOUND;

  state.file = filesystem::open_read(state.target, err);
  if (!state.file)
  {
    if (err == std::errc::no_such_file_or_directory)
      return FILE_NOT_FOUND;

    return SERVER_ERROR;
  }

  if (auto error = send_next(siter))
  {
    state.file.reset();
    return error;
  }

  state.status = session::TRANSFERRING;
  return 0;
}

auto handle_ack(std::span<const std::byte> msg,
                iterator_t siter) -> std::uint16_t
{
  using enum messages::error_t;

  auto &[key, session] = *siter;
  auto &state = session.state;

  auto ack = decode_ack(msg);
  if (!ack)
  {
    state.status = session::ABORTED;
    return SHORT_ACK;
  }

  if (ack->opc != messages::ACK || ack->block_num != state.block_num)
  {
    state.status = session::ABORTED;
    return UNEXPECTED_ACK;
  }

  // The block just acknowledged was short, so it was the last one.
  if (state.buffer.size() < messages::DATAMSG_MAXLEN)
  {
    state.file->close();
    state.status = session::COMPLETED;
    return 0;
  }

  if (auto error = send_next(siter))
  {
    state.status = session::ABORTED;
    return error;
  }

  return 0;
}
} // namespace boot::tftp
