/*
 * File Name:   include/pa2_layout.h
 * Description: PA2 record layout model and layout dictionary loading interfaces.
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

#ifndef PA2DECODER_PA2_LAYOUT_H_INCLUDED
#define PA2DECODER_PA2_LAYOUT_H_INCLUDED

#include "pa2_field.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tinyxml2
{
class XMLDocument;
}  // namespace tinyxml2

namespace pa2
{

/**
 * @brief Field layout of one PA2 record type.
 */
struct RecordLayout
{
    /** Two-byte record tag, for example `81` or `T ` (trailing space included). */
    std::string tag;
    /** Record type name used in renderings (for example `CurrencyConversion`). */
    std::string name;
    /** Human-readable record description from the layout dictionary. */
    std::string description;
    /** Fields in declaration order. */
    std::vector<FieldSpec> fields;

    /**
     * @brief Finds a field by name.
     * @param field_name Field name.
     * @return Pointer to field spec, or `nullptr` if not declared.
     */
    const FieldSpec *fieldByName(std::string_view field_name) const;

    /**
     * @brief Returns the declaration index of a field.
     * @param field_name Field name.
     * @return Index into `fields`, or `fields.size()` if not declared.
     */
    std::size_t fieldIndex(std::string_view field_name) const;

    friend bool operator==(const RecordLayout &, const RecordLayout &) = default;
};

/**
 * @brief Mapping from record tag to record layout.
 *
 * Built once from a layout dictionary XML file. `fromFile` and `fromString`
 * hand out a registry that can no longer change; lookups on it may run
 * concurrently.
 */
class LayoutRegistry
{
    public:
    /**
     * @brief Builds an immutable registry from a layout dictionary XML file.
     * @param path Path to the layout XML file.
     * @param error Optional output parameter for a human-readable error message.
     * @return The registry, or `nullptr` if loading failed.
     */
    static std::shared_ptr<const LayoutRegistry> fromFile(const std::string &path, std::string *error = nullptr);

    /**
     * @brief Builds an immutable registry from layout dictionary XML text.
     */
    static std::shared_ptr<const LayoutRegistry> fromString(const std::string &xml, std::string *error = nullptr);

    /**
     * @brief Loads a layout dictionary XML file.
     * @param path Path to the layout XML file.
     * @param error Optional output parameter for a human-readable error message.
     * @return `true` if loading succeeded, `false` otherwise (the registry is left empty).
     */
    bool loadFromFile(const std::string &path, std::string *error = nullptr);

    /**
     * @brief Loads a layout dictionary from XML text.
     * @param xml Layout dictionary document.
     * @param error Optional output parameter for a human-readable error message.
     * @return `true` if loading succeeded, `false` otherwise (the registry is left empty).
     */
    bool loadFromString(const std::string &xml, std::string *error = nullptr);

    /**
     * @brief Finds the layout for a record tag.
     * @param tag Two-byte tag, or a whole record line (only the first two bytes are used).
     * @return Pointer to layout, or `nullptr` if the tag is not registered.
     */
    const RecordLayout *layoutByTag(std::string_view tag) const;

    /**
     * @brief Returns all registered tags in dictionary order.
     */
    std::vector<std::string> tags() const;

    /**
     * @brief Returns the layout dictionary version attribute.
     */
    const std::string &version() const
    {
        return version_;
    }

    /**
     * @brief Returns the number of registered layouts.
     */
    std::size_t size() const
    {
        return layouts_.size();
    }

    /**
     * @brief Indicates whether no layout is registered.
     */
    bool empty() const
    {
        return layouts_.empty();
    }

    private:
    std::string                                  version_;
    std::vector<RecordLayout>                    layouts_;
    std::unordered_map<std::size_t, std::size_t> tag_index_;

    void clear();
    bool loadDocument(const tinyxml2::XMLDocument &doc, std::string *error);
};

}  // namespace pa2

#endif  // PA2DECODER_PA2_LAYOUT_H_INCLUDED
