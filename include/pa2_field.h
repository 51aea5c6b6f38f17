/*
 * File Name:   include/pa2_field.h
 * Description: Fixed-width field accessors for PA2 risk parameter records.
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

#ifndef PA2DECODER_PA2_FIELD_H_INCLUDED
#define PA2DECODER_PA2_FIELD_H_INCLUDED

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pa2
{

/**
 * @brief Wire convention used to decode a fixed-width field.
 */
enum class FieldKind
{
    /** Text with trailing whitespace removed. */
    String,
    /** Consecutive `step`-wide text chunks, blank chunks omitted. */
    StringGroup,
    /** Base-10 integer, absent when unparsable. */
    Integer,
    /** Base-10 integer times a scale, sign optionally carried by the next byte. */
    ScaledFloat,
    /** `YYYYMMDD` calendar date. */
    Date,
    /** `HHMM` time of day, midnight when unparsable. */
    Time,
    /** 14-byte chunks holding a start/end month pair. */
    TierSpans,
    /** 6-byte chunks of 5-digit magnitude plus sign flag, scaled by 1e-4. */
    SignedMagnitudeArray
};

/** Width of one TierSpans chunk. */
inline constexpr std::size_t kTierSpanWidth = 14;
/** Width of one SignedMagnitudeArray chunk. */
inline constexpr std::size_t kRiskValueWidth = 6;
/** Width of a Date field. */
inline constexpr std::size_t kDateWidth = 8;
/** Width of a Time field. */
inline constexpr std::size_t kTimeWidth = 4;
/** Scale applied when a ScaledFloat field does not configure one. */
inline constexpr double kDefaultScale = 1e-6;

/**
 * @brief Binds a field name to a byte range `[start, stop)` and a decode convention.
 */
struct FieldSpec
{
    /** Field name, unique within its record layout. */
    std::string name;
    /** Decode convention. */
    FieldKind kind = FieldKind::String;
    /** First byte of the field (0-based). */
    std::size_t start = 0;
    /** One past the last byte of the field. */
    std::size_t stop = 0;
    /** Chunk width for grouped kinds, `0` otherwise. */
    std::size_t step = 0;
    /** Scale for ScaledFloat; a negative value enables the out-of-band sign byte. */
    double scale = kDefaultScale;

    friend bool operator==(const FieldSpec &, const FieldSpec &) = default;
};

/**
 * @brief Start/end contract month pair of a margin tier.
 */
struct TierSpan
{
    std::int32_t start_month = 0;
    std::int32_t end_month   = 0;

    friend bool operator==(const TierSpan &, const TierSpan &) = default;
};

/** Calendar date value of a Date field. */
using Date = std::chrono::year_month_day;
/** Time since midnight of a Time field. */
using TimeOfDay = std::chrono::minutes;

/**
 * @brief Decoded value of one field.
 *
 * The alternative in use is fixed by the field kind: String `std::string`,
 * StringGroup `std::vector<std::string>`, Integer `std::optional<std::int64_t>`,
 * ScaledFloat `double`, Date `Date`, Time `TimeOfDay`, TierSpans
 * `std::vector<TierSpan>` and SignedMagnitudeArray `std::vector<double>`.
 */
using FieldValue = std::variant<std::string,
                                std::vector<std::string>,
                                std::optional<std::int64_t>,
                                double,
                                Date,
                                TimeOfDay,
                                std::vector<TierSpan>,
                                std::vector<double>>;

/**
 * @brief Maps a layout dictionary kind name (`string`, `strings`, `int`, `float`,
 *        `date`, `time`, `spans`, `risk`) to a field kind.
 * @param name Kind name, case sensitive.
 * @return Field kind, or `std::nullopt` for unknown names.
 */
std::optional<FieldKind> fieldKindFromName(std::string_view name);

/**
 * @brief Returns the layout dictionary name of a field kind.
 */
std::string_view fieldKindName(FieldKind kind);

/**
 * @brief Checks that the byte range of `spec` lies within `line`.
 *
 * String and StringGroup fields never fail this check, their slices are
 * clamped to the line instead.
 */
bool fieldRangeFits(std::string_view line, const FieldSpec &spec);

/**
 * @brief Slices `[start, stop)` and strips trailing whitespace.
 */
std::string decodeString(std::string_view line, const FieldSpec &spec);

/**
 * @brief Splits `[start, stop)` into `step`-wide chunks, right-trims each and drops empty ones.
 */
std::vector<std::string> decodeStringGroup(std::string_view line, const FieldSpec &spec);

/**
 * @brief Parses `[start, stop)` as a signed base-10 integer.
 * @return The integer, or `std::nullopt` when the text does not parse.
 */
std::optional<std::int64_t> decodeInteger(std::string_view line, const FieldSpec &spec);

/**
 * @brief Parses `[start, stop)` as an integer and multiplies by the effective scale.
 *
 * The effective scale is the configured scale when it is negative and the
 * byte at `stop` is `-`, otherwise its absolute value.
 *
 * @return The scaled value, or quiet NaN when the text does not parse.
 */
double decodeScaledFloat(std::string_view line, const FieldSpec &spec);

/**
 * @brief Parses eight bytes at `start` as `YYYYMMDD`.
 * @return The date, or `std::nullopt` when malformed.
 */
std::optional<Date> decodeDate(std::string_view line, const FieldSpec &spec);

/**
 * @brief Parses four bytes at `start` as `HHMM`.
 *
 * Blank or otherwise unparsable input silently yields midnight.
 */
TimeOfDay decodeTime(std::string_view line, const FieldSpec &spec);

/**
 * @brief Decodes all-digit 14-byte chunks into month pairs at chunk offsets 2 and 8.
 *
 * Chunks containing any non-digit byte are skipped.
 */
std::vector<TierSpan> decodeTierSpans(std::string_view line, const FieldSpec &spec);

/**
 * @brief Decodes 6-byte `MMMMMs` chunks into `±MMMMM * 1e-4`.
 * @return One value per chunk, or `std::nullopt` when any magnitude is malformed.
 */
std::optional<std::vector<double>> decodeSignedMagnitudeArray(std::string_view line, const FieldSpec &spec);

}  // namespace pa2

#endif  // PA2DECODER_PA2_FIELD_H_INCLUDED
