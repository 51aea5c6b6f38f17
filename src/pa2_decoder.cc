/*
 * File Name:   src/pa2_decoder.cc
 * Description: PA2 record decoder implementation.
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

#include "pa2_decoder.h"

#include "pa2_record_tag.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <numeric>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pa2
{

namespace
{

    // Shortest round-trip digits, switching to exponent form below 1e-4 and from 1e16.
    std::string formatDouble(const double value)
    {
        if(std::isnan(value))
        {
            return "nan";
        }
        if(std::isinf(value))
        {
            return value < 0 ? "-inf" : "inf";
        }

        char buffer[64]      = {};
        const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
        if(ec != std::errc{})
        {
            return "nan";
        }

        const std::string_view text(buffer, static_cast<std::size_t>(ptr - buffer));
        const std::size_t      e_pos    = text.find('e');
        const bool             negative = text.front() == '-';
        std::string            digits;
        for(const char c: text.substr(negative ? 1 : 0, e_pos - (negative ? 1 : 0)))
        {
            if(c != '.')
            {
                digits.push_back(c);
            }
        }
        const int exponent = std::atoi(std::string(text.substr(e_pos + 1)).c_str());

        std::string out = negative ? "-" : "";
        if(exponent >= -4 && exponent < 16)
        {
            if(exponent < 0)
            {
                out += "0.";
                out.append(static_cast<std::size_t>(-exponent - 1), '0');
                out += digits;
                return out;
            }
            const auto int_len = static_cast<std::size_t>(exponent) + 1;
            if(digits.size() <= int_len)
            {
                out += digits;
                out.append(int_len - digits.size(), '0');
                out += ".0";
                return out;
            }
            out += digits.substr(0, int_len);
            out += '.';
            out += digits.substr(int_len);
            return out;
        }

        out += digits.front();
        if(digits.size() > 1)
        {
            out += '.';
            out += digits.substr(1);
        }
        std::ostringstream oss;
        oss << 'e' << (exponent < 0 ? '-' : '+') << std::setw(2) << std::setfill('0') << std::abs(exponent);
        out += oss.str();
        return out;
    }

    std::string quote(const std::string_view text)
    {
        std::string out = "'";
        for(const char c: text)
        {
            if(c == '\'' || c == '\\')
            {
                out += '\\';
            }
            out += c;
        }
        out += '\'';
        return out;
    }

    template<typename Range, typename Format>
    std::string formatSequence(const Range &items, Format format)
    {
        std::string out = "(";
        bool        first = true;
        for(const auto &item: items)
        {
            if(!first)
            {
                out += ", ";
            }
            out += format(item);
            first = false;
        }
        // A one-element tuple keeps its trailing comma.
        if(items.size() == 1)
        {
            out += ',';
        }
        out += ')';
        return out;
    }

    struct ValueFormatter
    {
        std::string operator()(const std::string &text) const
        {
            return quote(text);
        }

        std::string operator()(const std::vector<std::string> &texts) const
        {
            return formatSequence(texts, quote);
        }

        std::string operator()(const std::optional<std::int64_t> &number) const
        {
            return number ? std::to_string(*number) : "None";
        }

        std::string operator()(const double number) const
        {
            return formatDouble(number);
        }

        std::string operator()(const Date &date) const
        {
            std::ostringstream oss;
            oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-' << std::setw(2)
                << static_cast<unsigned>(date.month()) << '-' << std::setw(2) << static_cast<unsigned>(date.day());
            return oss.str();
        }

        std::string operator()(const TimeOfDay &time) const
        {
            const auto         hours = std::chrono::duration_cast<std::chrono::hours>(time);
            std::ostringstream oss;
            oss << std::setfill('0') << std::setw(2) << hours.count() << ':' << std::setw(2) << (time - hours).count();
            return oss.str();
        }

        std::string operator()(const std::vector<TierSpan> &spans) const
        {
            return formatSequence(spans,
                                  [](const TierSpan &span)
                                  {
                                      return "(" + std::to_string(span.start_month) + ", "
                                             + std::to_string(span.end_month) + ")";
                                  });
        }

        std::string operator()(const std::vector<double> &numbers) const
        {
            return formatSequence(numbers, formatDouble);
        }
    };

}  // namespace

DecodeException::DecodeException(DecodeError error)
    : std::runtime_error(Decoder::decodeErrorText(error))
      , error_(std::move(error))
{
}

DecodedRecord::DecodedRecord(std::string                         raw_line,
                             std::shared_ptr<const RecordLayout> layout,
                             std::vector<FieldValue>             values)
    : raw_line_(std::move(raw_line))
      , layout_(std::move(layout))
      , values_(std::move(values))
{
}

std::string_view DecodedRecord::tag() const
{
    return layout_ ? std::string_view{layout_->tag} : std::string_view{};
}

std::string_view DecodedRecord::typeName() const
{
    return layout_ ? std::string_view{layout_->name} : std::string_view{};
}

FieldLookup DecodedRecord::operator[](const std::string_view field_name) const
{
    if(!layout_)
    {
        return FieldLookup(nullptr, nullptr);
    }
    const std::size_t index = layout_->fieldIndex(field_name);
    if(index >= values_.size())
    {
        return FieldLookup(nullptr, nullptr);
    }
    return FieldLookup(&layout_->fields[index], &values_[index]);
}

std::vector<std::string> DecodedRecord::fieldNames() const
{
    std::vector<std::string> names;
    if(!layout_)
    {
        return names;
    }
    names.reserve(layout_->fields.size());
    for(const auto &spec: layout_->fields)
    {
        names.push_back(spec.name);
    }
    return names;
}

std::string DecodedRecord::toString() const
{
    std::vector<std::size_t> order(values_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if(layout_)
    {
        std::ranges::sort(order,
                          [this](const std::size_t lhs, const std::size_t rhs)
                          { return layout_->fields[lhs].name < layout_->fields[rhs].name; });
    }

    std::string out(typeName());
    out += '(';
    for(std::size_t i = 0; i < order.size(); ++i)
    {
        if(i > 0)
        {
            out += ", ";
        }
        out += layout_->fields[order[i]].name;
        out += '=';
        out += formatFieldValue(values_[order[i]]);
    }
    out += ')';
    return out;
}

bool operator==(const DecodedRecord &lhs, const DecodedRecord &rhs)
{
    if(lhs.raw_line_ != rhs.raw_line_)
    {
        return false;
    }
    if(lhs.layout_ == rhs.layout_)
    {
        return true;
    }
    return lhs.layout_ && rhs.layout_ && *lhs.layout_ == *rhs.layout_;
}

std::string formatFieldValue(const FieldValue &value)
{
    return std::visit(ValueFormatter{}, value);
}

Decoder::Decoder() : layouts_(std::make_shared<LayoutRegistry>())
{
}

Decoder::Decoder(std::shared_ptr<const LayoutRegistry> layouts) : layouts_(std::move(layouts))
{
    if(!layouts_)
    {
        throw std::invalid_argument("Decoder requires a layout registry");
    }
}

bool Decoder::loadLayoutsFromFile(const std::string &path, std::string *error)
{
    std::shared_ptr<const LayoutRegistry> loaded = LayoutRegistry::fromFile(path, error);
    if(!loaded)
    {
        return false;
    }
    layouts_ = std::move(loaded);
    return true;
}

bool Decoder::loadLayoutsFromString(const std::string &xml, std::string *error)
{
    std::shared_ptr<const LayoutRegistry> loaded = LayoutRegistry::fromString(xml, error);
    if(!loaded)
    {
        return false;
    }
    layouts_ = std::move(loaded);
    return true;
}

DecodeErrorCode Decoder::decodeField(const std::string_view line, const FieldSpec &spec, FieldValue &value)
{
    if(!fieldRangeFits(line, spec))
    {
        return DecodeErrorCode::kLineTooShort;
    }

    switch(spec.kind)
    {
        case FieldKind::String:
            value = decodeString(line, spec);
            break;
        case FieldKind::StringGroup:
            value = decodeStringGroup(line, spec);
            break;
        case FieldKind::Integer:
            value = decodeInteger(line, spec);
            break;
        case FieldKind::ScaledFloat:
            value = decodeScaledFloat(line, spec);
            break;
        case FieldKind::Date:
        {
            std::optional<Date> date = decodeDate(line, spec);
            if(!date)
            {
                return DecodeErrorCode::kMalformedDate;
            }
            value = *date;
            break;
        }
        case FieldKind::Time:
            value = decodeTime(line, spec);
            break;
        case FieldKind::TierSpans:
            value = decodeTierSpans(line, spec);
            break;
        case FieldKind::SignedMagnitudeArray:
        {
            std::optional<std::vector<double>> risk = decodeSignedMagnitudeArray(line, spec);
            if(!risk)
            {
                return DecodeErrorCode::kMalformedRiskArray;
            }
            value = std::move(*risk);
            break;
        }
    }
    return DecodeErrorCode::kNone;
}

bool Decoder::decodeLine(const std::string_view line, DecodedRecord &record, DecodeError &error) const
{
    const RecordLayout *layout = layouts_->layoutByTag(line);
    if(!layout)
    {
        error = DecodeError{DecodeErrorCode::kUnknownTag, std::string(record_tag_key::tagOf(line)), {}, line.size()};
        return false;
    }

    std::vector<FieldValue> values;
    values.reserve(layout->fields.size());
    for(const FieldSpec &spec: layout->fields)
    {
        FieldValue            value;
        const DecodeErrorCode code = decodeField(line, spec, value);
        if(code != DecodeErrorCode::kNone)
        {
            error = DecodeError{code, layout->tag, spec.name, line.size()};
            return false;
        }
        values.push_back(std::move(value));
    }

    // The record shares ownership of the whole registry its layout lives in.
    record = DecodedRecord(std::string(line), std::shared_ptr<const RecordLayout>(layouts_, layout), std::move(values));
    return true;
}

DecodedRecord Decoder::decodeLine(const std::string_view line) const
{
    DecodedRecord record;
    DecodeError   error;
    if(!decodeLine(line, record, error))
    {
        throw DecodeException(std::move(error));
    }
    return record;
}

std::string Decoder::decodeErrorText(const DecodeError &error)
{
    switch(error.code)
    {
        case DecodeErrorCode::kNone:
            return "No error";
        case DecodeErrorCode::kUnknownTag:
            return "Unknown record tag '" + error.tag + "'";
        case DecodeErrorCode::kLineTooShort:
            return "Field '" + error.field + "' of record '" + error.tag + "' extends past end of line (length "
                   + std::to_string(error.line_length) + ")";
        case DecodeErrorCode::kMalformedDate:
            return "Malformed date in field '" + error.field + "' of record '" + error.tag + "'";
        case DecodeErrorCode::kMalformedRiskArray:
            return "Malformed risk array in field '" + error.field + "' of record '" + error.tag + "'";
    }
    return "Unknown decode error";
}

}  // namespace pa2
