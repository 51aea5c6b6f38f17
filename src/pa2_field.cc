/*
 * File Name:   src/pa2_field.cc
 * Description: Fixed-width field accessor implementation.
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

#include "pa2_field.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>

namespace pa2
{

namespace
{

    bool isBlank(const char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool isDigit(const char c)
    {
        return c >= '0' && c <= '9';
    }

    bool allDigits(const std::string_view text)
    {
        return !text.empty() && std::ranges::all_of(text, isDigit);
    }

    std::string_view rightTrim(std::string_view text)
    {
        while(!text.empty() && isBlank(text.back()))
        {
            text.remove_suffix(1);
        }
        return text;
    }

    std::string_view trim(std::string_view text)
    {
        while(!text.empty() && isBlank(text.front()))
        {
            text.remove_prefix(1);
        }
        return rightTrim(text);
    }

    // Clamped like a substring: ranges past the end of the line shrink.
    std::string_view slice(const std::string_view line, const std::size_t start, const std::size_t stop)
    {
        if(start >= line.size() || stop <= start)
        {
            return std::string_view{};
        }
        return line.substr(start, stop - start);
    }

    std::optional<std::int64_t> parseInteger(std::string_view text)
    {
        text = trim(text);
        if(!text.empty() && text.front() == '+')
        {
            text.remove_prefix(1);
            if(!text.empty() && text.front() == '-')
            {
                return std::nullopt;
            }
        }
        const std::string_view digits = (!text.empty() && text.front() == '-') ? text.substr(1) : text;
        if(!allDigits(digits))
        {
            return std::nullopt;
        }

        std::int64_t parsed  = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if(ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return parsed;
    }

    std::optional<int> parseDigits(const std::string_view text)
    {
        if(!allDigits(text))
        {
            return std::nullopt;
        }
        int parsed           = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if(ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return parsed;
    }

    std::size_t requiredEnd(const FieldSpec &spec)
    {
        switch(spec.kind)
        {
            case FieldKind::Date:
                return spec.start + kDateWidth;
            case FieldKind::Time:
                return spec.start + kTimeWidth;
            default:
                return spec.stop;
        }
    }

    constexpr std::array<std::pair<FieldKind, std::string_view>, 8> kKindNames = {{
     {FieldKind::String, "string"},
     {FieldKind::StringGroup, "strings"},
     {FieldKind::Integer, "int"},
     {FieldKind::ScaledFloat, "float"},
     {FieldKind::Date, "date"},
     {FieldKind::Time, "time"},
     {FieldKind::TierSpans, "spans"},
     {FieldKind::SignedMagnitudeArray, "risk"},
    }};

}  // namespace

std::optional<FieldKind> fieldKindFromName(const std::string_view name)
{
    for(const auto &[kind, kind_name]: kKindNames)
    {
        if(kind_name == name)
        {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view fieldKindName(const FieldKind kind)
{
    for(const auto &[candidate, kind_name]: kKindNames)
    {
        if(candidate == kind)
        {
            return kind_name;
        }
    }
    return "unknown";
}

bool fieldRangeFits(const std::string_view line, const FieldSpec &spec)
{
    if(spec.kind == FieldKind::String || spec.kind == FieldKind::StringGroup)
    {
        return true;
    }
    const std::size_t end = requiredEnd(spec);
    return spec.start <= end && end <= line.size();
}

std::string decodeString(const std::string_view line, const FieldSpec &spec)
{
    return std::string(rightTrim(slice(line, spec.start, spec.stop)));
}

std::vector<std::string> decodeStringGroup(const std::string_view line, const FieldSpec &spec)
{
    std::vector<std::string> result;
    if(spec.step == 0)
    {
        return result;
    }

    for(std::size_t index = spec.start; index < spec.stop; index += spec.step)
    {
        const std::string_view chunk = rightTrim(slice(line, index, index + spec.step));
        if(!chunk.empty())
        {
            result.emplace_back(chunk);
        }
    }
    return result;
}

std::optional<std::int64_t> decodeInteger(const std::string_view line, const FieldSpec &spec)
{
    return parseInteger(slice(line, spec.start, spec.stop));
}

double decodeScaledFloat(const std::string_view line, const FieldSpec &spec)
{
    const std::optional<std::int64_t> raw = parseInteger(slice(line, spec.start, spec.stop));
    if(!raw)
    {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // The sign lives in the byte after the digits; a line ending at `stop` carries no sign.
    const bool   negative = spec.scale < 0 && spec.stop < line.size() && line[spec.stop] == '-';
    const double scale    = negative ? spec.scale : std::abs(spec.scale);
    return static_cast<double>(*raw) * scale;
}

std::optional<Date> decodeDate(const std::string_view line, const FieldSpec &spec)
{
    const std::string_view text = slice(line, spec.start, spec.start + kDateWidth);
    if(text.size() != kDateWidth)
    {
        return std::nullopt;
    }

    const std::optional<int> year  = parseDigits(text.substr(0, 4));
    const std::optional<int> month = parseDigits(text.substr(4, 2));
    const std::optional<int> day   = parseDigits(text.substr(6, 2));
    if(!year || !month || !day)
    {
        return std::nullopt;
    }

    const Date date{std::chrono::year{*year},
                    std::chrono::month{static_cast<unsigned>(*month)},
                    std::chrono::day{static_cast<unsigned>(*day)}};
    if(!date.ok())
    {
        return std::nullopt;
    }
    return date;
}

TimeOfDay decodeTime(const std::string_view line, const FieldSpec &spec)
{
    const std::string_view text = slice(line, spec.start, spec.start + kTimeWidth);
    if(text.size() != kTimeWidth)
    {
        return TimeOfDay{0};
    }

    const std::optional<int> hour   = parseDigits(text.substr(0, 2));
    const std::optional<int> minute = parseDigits(text.substr(2, 2));
    if(!hour || !minute || *hour > 23 || *minute > 59)
    {
        return TimeOfDay{0};
    }
    return std::chrono::hours{*hour} + std::chrono::minutes{*minute};
}

std::vector<TierSpan> decodeTierSpans(const std::string_view line, const FieldSpec &spec)
{
    std::vector<TierSpan> result;
    for(std::size_t index = spec.start; index < spec.stop; index += kTierSpanWidth)
    {
        const std::string_view chunk = slice(line, index, index + kTierSpanWidth);
        if(chunk.size() != kTierSpanWidth || !allDigits(chunk))
        {
            continue;
        }

        // All 14 bytes are digits, so both six-digit sub-fields parse.
        const std::optional<int> start_month = parseDigits(chunk.substr(2, 6));
        const std::optional<int> end_month   = parseDigits(chunk.substr(8, 6));
        result.push_back(TierSpan{*start_month, *end_month});
    }
    return result;
}

std::optional<std::vector<double>> decodeSignedMagnitudeArray(const std::string_view line, const FieldSpec &spec)
{
    static constexpr double      unit            = 1e-4;
    static constexpr std::size_t magnitude_width = kRiskValueWidth - 1;

    std::vector<double> result;
    result.reserve((spec.stop - spec.start) / kRiskValueWidth);

    for(std::size_t index = spec.start; index + kRiskValueWidth <= spec.stop; index += kRiskValueWidth)
    {
        if(index + kRiskValueWidth > line.size())
        {
            return std::nullopt;
        }
        const std::optional<std::int64_t> magnitude = parseInteger(slice(line, index, index + magnitude_width));
        if(!magnitude)
        {
            return std::nullopt;
        }
        const bool negative = line[index + magnitude_width] == '-';
        result.push_back(static_cast<double>(*magnitude) * (negative ? -unit : unit));
    }
    return result;
}

}  // namespace pa2
