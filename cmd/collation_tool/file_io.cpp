// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "file_io.hpp"

#include <sharding/core/byte_string.hpp>

#include <quill/Quill.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

SHARDING_NAMESPACE_BEGIN

std::optional<byte_string> read_file(std::filesystem::path const &path)
{
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        LOG_ERROR("could not open {} for reading", path.string());
        return std::nullopt;
    }
    return byte_string{
        std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
}

bool write_file(std::filesystem::path const &path, byte_string_view const data)
{
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os) {
        LOG_ERROR("could not open {} for writing", path.string());
        return false;
    }
    os.write(
        reinterpret_cast<char const *>(data.data()),
        static_cast<std::streamsize>(data.size()));
    if (!os) {
        LOG_ERROR("short write of {} bytes to {}", data.size(), path.string());
        return false;
    }
    return true;
}

SHARDING_NAMESPACE_END
