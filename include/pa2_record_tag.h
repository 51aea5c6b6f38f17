/*
 * File Name:   include/pa2_record_tag.h
 * Description: Key extraction for PA2 record tags.
 *
 * Copyright (C) 2026 The pa2decoder authors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 *
 * @date: 2026-02-11
 */

#ifndef PA2DECODER_PA2_RECORD_TAG_H_INCLUDED
#define PA2DECODER_PA2_RECORD_TAG_H_INCLUDED

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace pa2
{

/**
 * @brief Template key extractor for the leading record tag of a PA2 line.
 *
 * Copies up to `Width` leading bytes of the line into the key. Lines shorter
 * than `Width` are zero-padded, so a one-byte line never collides with a tag
 * whose second byte is a space.
 *
 * @tparam Width Number of leading bytes forming the tag (must be `<= sizeof(size_t)`).
 */
template<std::size_t Width = 2>
struct basic_record_tag_key
{
    static_assert(Width > 0 && Width <= sizeof(std::size_t), "Width must be in [1, sizeof(size_t)]");

    /** Number of bytes forming a complete tag. */
    static constexpr std::size_t width = Width;

    /**
     * @brief Builds a key from a raw record line or a bare tag.
     * @param line Record line; only the first `Width` bytes are used.
     */
    explicit basic_record_tag_key(std::string_view line) : hash_(0)
    {
        char              buffer[sizeof(std::size_t)] = {};
        const std::size_t count                       = (line.size() < Width) ? line.size() : Width;
        if(count > 0)
        {
            std::memcpy(buffer, line.data(), count);
        }
        std::memcpy(&hash_, buffer, sizeof(std::size_t));
    }

    /**
     * @brief Returns the computed key hash.
     * @return Integral value identifying the tag.
     */
    std::size_t hash() const
    {
        return hash_;
    }

    /**
     * @brief Extracts the tag text of a line.
     * @param line Record line.
     * @return The first `Width` bytes, or the whole line when shorter.
     */
    static std::string_view tagOf(std::string_view line)
    {
        return line.substr(0, Width);
    }

    friend bool operator==(const basic_record_tag_key &, const basic_record_tag_key &) = default;

    private:
    std::size_t hash_;
};

/**
 * @brief Default key extractor for the two-byte PA2 record tag.
 */
using record_tag_key = basic_record_tag_key<2>;

}  // namespace pa2

#endif  // PA2DECODER_PA2_RECORD_TAG_H_INCLUDED
