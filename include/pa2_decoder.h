/*
 * File Name:   include/pa2_decoder.h
 * Description: Decoder interface for PA2 risk parameter records.
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

#ifndef PA2DECODER_PA2_DECODER_H_INCLUDED
#define PA2DECODER_PA2_DECODER_H_INCLUDED

#include "pa2_field.h"
#include "pa2_layout.h"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pa2
{

/**
 * @brief Reason a record line could not be decoded.
 */
enum class DecodeErrorCode : std::int32_t
{
    kNone = 0,
    /** The two-byte tag has no registered layout. */
    kUnknownTag,
    /** A non-text field extends past the end of the line. */
    kLineTooShort,
    /** A Date field is not a valid `YYYYMMDD` date. */
    kMalformedDate,
    /** A SignedMagnitudeArray field holds a non-numeric magnitude. */
    kMalformedRiskArray
};

/**
 * @brief Failure details of one `Decoder::decodeLine` call.
 */
struct DecodeError
{
    DecodeErrorCode code = DecodeErrorCode::kNone;
    /** Tag of the offending line. */
    std::string tag;
    /** Name of the offending field, empty for tag errors. */
    std::string field;
    /** Length of the offending line. */
    std::size_t line_length = 0;
};

/**
 * @brief Exception thrown by the throwing `Decoder::decodeLine` overload.
 */
class DecodeException : public std::runtime_error
{
    public:
    explicit DecodeException(DecodeError error);

    const DecodeError &error() const
    {
        return error_;
    }

    private:
    DecodeError error_;
};

/**
 * @brief Lightweight lookup handle returned by `DecodedRecord::operator[]`.
 */
class FieldLookup
{
    public:
    /**
     * @brief Indicates whether the record layout declares the field.
     */
    bool exists() const
    {
        return value_ != nullptr;
    }

    /**
     * @brief Returns the field spec, or `nullptr` if missing.
     */
    const FieldSpec *spec() const
    {
        return spec_;
    }

    /**
     * @brief Returns the decoded value, or `nullptr` if missing.
     */
    const FieldValue *value() const
    {
        return value_;
    }

    /**
     * @brief Typed accessor helper based on `std::get_if`.
     * @tparam T Requested variant alternative type.
     * @return Pointer to value if present with that type, otherwise `nullptr`.
     */
    template<typename T>
    const T *as() const
    {
        return value_ ? std::get_if<T>(value_) : nullptr;
    }

    private:
    friend class DecodedRecord;

    FieldLookup(const FieldSpec *spec, const FieldValue *value) : spec_(spec), value_(value)
    {
    }

    const FieldSpec  *spec_  = nullptr;
    const FieldValue *value_ = nullptr;
};

/**
 * @brief A decoded PA2 record: the raw line plus one value per layout field.
 */
class DecodedRecord
{
    public:
    DecodedRecord() = default;

    /** @brief Returns the line the record was decoded from. */
    const std::string &rawLine() const
    {
        return raw_line_;
    }

    /** @brief Returns the layout used, or `nullptr` for a default constructed record. */
    const RecordLayout *layout() const
    {
        return layout_.get();
    }

    /** @brief Returns the record tag. */
    std::string_view tag() const;

    /** @brief Returns the record type name, for example `CurrencyConversion`. */
    std::string_view typeName() const;

    /**
     * @brief Lookup by field name.
     */
    FieldLookup operator[](std::string_view field_name) const;

    /** @brief Returns field names in layout order. */
    std::vector<std::string> fieldNames() const;

    /** @brief Returns decoded values in layout order. */
    const std::vector<FieldValue> &values() const
    {
        return values_;
    }

    /**
     * @brief Renders `TypeName(a=..., b=...)` with field names sorted.
     */
    std::string toString() const;

    /** Equal when raw line and layout (tag, name and fields) match. */
    friend bool operator==(const DecodedRecord &lhs, const DecodedRecord &rhs);

    private:
    friend class Decoder;

    DecodedRecord(std::string raw_line, std::shared_ptr<const RecordLayout> layout, std::vector<FieldValue> values);

    std::string                         raw_line_;
    std::shared_ptr<const RecordLayout> layout_;
    std::vector<FieldValue>             values_;
};

/**
 * @brief Renders a field value the way `DecodedRecord::toString` does.
 */
std::string formatFieldValue(const FieldValue &value);

/**
 * @brief Decodes PA2 record lines using a layout dictionary.
 *
 * The layout dictionary is immutable once built and shared with every record
 * decoded from it. Loading builds a new dictionary and only replaces the
 * current one on success, so records decoded earlier stay valid after a
 * reload or after the decoder is gone. Decoding only reads the dictionary,
 * so one decoder may serve any number of threads; loading is a non-const
 * operation and must not overlap with decoding.
 */
class Decoder
{
    public:
    Decoder();

    /**
     * @brief Decodes with an already built layout dictionary.
     * @param layouts Layout dictionary, must not be `nullptr`.
     */
    explicit Decoder(std::shared_ptr<const LayoutRegistry> layouts);

    /**
     * @brief Loads the layout dictionary XML file.
     * @param path Path to layout XML file.
     * @param error Optional output parameter for a human-readable error message.
     * @return `true` if the layouts were loaded, `false` otherwise (the previous layouts stay in use).
     */
    bool loadLayoutsFromFile(const std::string &path, std::string *error = nullptr);

    /**
     * @brief Loads the layout dictionary from XML text.
     */
    bool loadLayoutsFromString(const std::string &xml, std::string *error = nullptr);

    /** @brief Returns the current layouts. */
    const LayoutRegistry &layouts() const
    {
        return *layouts_;
    }

    /** @brief Returns a shared handle to the current layouts. */
    std::shared_ptr<const LayoutRegistry> sharedLayouts() const
    {
        return layouts_;
    }

    /**
     * @brief Decodes one record line.
     * @param line Complete fixed-width record line.
     * @param record Receives the decoded record on success, untouched on failure.
     * @param error Receives failure details on failure.
     * @return `true` on success.
     */
    bool decodeLine(std::string_view line, DecodedRecord &record, DecodeError &error) const;

    /**
     * @brief Decodes one record line.
     * @param line Complete fixed-width record line.
     * @return The decoded record.
     * @throws DecodeException when the line cannot be decoded.
     */
    DecodedRecord decodeLine(std::string_view line) const;

    /**
     * @brief Decodes a single field of a line.
     * @param line Record line.
     * @param spec Field to decode.
     * @param value Receives the value on success.
     * @return `DecodeErrorCode::kNone` on success, otherwise the failure reason.
     */
    static DecodeErrorCode decodeField(std::string_view line, const FieldSpec &spec, FieldValue &value);

    /**
     * @brief Builds a human-readable message for a decode error.
     */
    static std::string decodeErrorText(const DecodeError &error);

    private:
    std::shared_ptr<const LayoutRegistry> layouts_;
};

}  // namespace pa2

#endif  // PA2DECODER_PA2_DECODER_H_INCLUDED
