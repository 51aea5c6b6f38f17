/*
 * File Name:   src/pa2_layout.cc
 * Description: PA2 layout dictionary XML parser and lookup implementation.
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

#include "pa2_layout.h"

#include "pa2_record_tag.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <tinyxml2.h>
#include <unordered_set>
#include <utility>

namespace pa2
{

namespace
{

    std::string attributeOrEmpty(const tinyxml2::XMLElement *element, const char *name)
    {
        const char *value = element->Attribute(name);
        return value ? value : "";
    }

    bool readPosition(const tinyxml2::XMLElement *element, const char *name, std::size_t &out)
    {
        unsigned value = 0;
        if(element->QueryUnsignedAttribute(name, &value) != tinyxml2::XML_SUCCESS)
        {
            return false;
        }
        out = value;
        return true;
    }

    std::string describeField(const RecordLayout &layout, const std::string &field_name)
    {
        return "layout '" + layout.tag + "' field '" + field_name + "'";
    }

    std::optional<std::string> parseField(const tinyxml2::XMLElement *element, const RecordLayout &layout, FieldSpec &spec)
    {
        spec.name = attributeOrEmpty(element, "name");
        if(spec.name.empty())
        {
            return "layout '" + layout.tag + "' has a field without a name";
        }

        const std::string              kind_name = attributeOrEmpty(element, "kind");
        const std::optional<FieldKind> kind      = fieldKindFromName(kind_name);
        if(!kind)
        {
            return describeField(layout, spec.name) + " has unknown kind '" + kind_name + "'";
        }
        spec.kind = *kind;

        if(!readPosition(element, "start", spec.start))
        {
            return describeField(layout, spec.name) + " is missing a numeric start";
        }

        std::size_t fixed_width = 0;
        if(spec.kind == FieldKind::Date)
        {
            fixed_width = kDateWidth;
        }
        else if(spec.kind == FieldKind::Time)
        {
            fixed_width = kTimeWidth;
        }

        if(!readPosition(element, "stop", spec.stop))
        {
            if(fixed_width == 0)
            {
                return describeField(layout, spec.name) + " is missing a numeric stop";
            }
            spec.stop = spec.start + fixed_width;
        }
        if(spec.start > spec.stop)
        {
            return describeField(layout, spec.name) + " has start after stop";
        }
        if(fixed_width != 0 && spec.stop - spec.start != fixed_width)
        {
            return describeField(layout, spec.name) + " must be " + std::to_string(fixed_width) + " bytes wide";
        }

        switch(spec.kind)
        {
            case FieldKind::StringGroup:
                if(!readPosition(element, "step", spec.step) || spec.step == 0)
                {
                    return describeField(layout, spec.name) + " is missing a positive step";
                }
                break;
            case FieldKind::TierSpans:
                spec.step = kTierSpanWidth;
                break;
            case FieldKind::SignedMagnitudeArray:
                spec.step = kRiskValueWidth;
                break;
            case FieldKind::ScaledFloat:
                if(element->Attribute("scale") && element->QueryDoubleAttribute("scale", &spec.scale) != tinyxml2::XML_SUCCESS)
                {
                    return describeField(layout, spec.name) + " has a non-numeric scale";
                }
                break;
            default:
                break;
        }

        if(spec.step != 0 && (spec.stop - spec.start) % spec.step != 0)
        {
            return describeField(layout, spec.name) + " width is not a multiple of " + std::to_string(spec.step);
        }

        return std::nullopt;
    }

    std::optional<std::string> parseRecord(const tinyxml2::XMLElement *element, RecordLayout &layout)
    {
        layout.tag         = attributeOrEmpty(element, "tag");
        layout.name        = attributeOrEmpty(element, "name");
        layout.description = attributeOrEmpty(element, "description");

        // Single-character tags are space padded on the wire.
        if(layout.tag.size() == 1)
        {
            layout.tag.push_back(' ');
        }
        if(layout.tag.size() != record_tag_key::width)
        {
            return "record tag '" + layout.tag + "' is not " + std::to_string(record_tag_key::width) + " bytes";
        }
        if(layout.name.empty())
        {
            return "layout '" + layout.tag + "' has no name";
        }

        std::unordered_set<std::string> names;
        for(const tinyxml2::XMLElement *field = element->FirstChildElement("field"); field;
            field                             = field->NextSiblingElement("field"))
        {
            FieldSpec spec;
            if(std::optional<std::string> failure = parseField(field, layout, spec))
            {
                return failure;
            }
            if(!names.insert(spec.name).second)
            {
                return describeField(layout, spec.name) + " is declared twice";
            }
            layout.fields.push_back(std::move(spec));
        }

        return std::nullopt;
    }

}  // namespace

const FieldSpec *RecordLayout::fieldByName(const std::string_view field_name) const
{
    const std::size_t index = fieldIndex(field_name);
    if(index == fields.size())
    {
        return nullptr;
    }
    return &fields[index];
}

std::size_t RecordLayout::fieldIndex(const std::string_view field_name) const
{
    const auto it = std::find_if(fields.begin(),
                                 fields.end(),
                                 [field_name](const FieldSpec &spec) { return spec.name == field_name; });
    return static_cast<std::size_t>(it - fields.begin());
}

std::shared_ptr<const LayoutRegistry> LayoutRegistry::fromFile(const std::string &path, std::string *error)
{
    auto registry = std::make_shared<LayoutRegistry>();
    if(!registry->loadFromFile(path, error))
    {
        return nullptr;
    }
    return registry;
}

std::shared_ptr<const LayoutRegistry> LayoutRegistry::fromString(const std::string &xml, std::string *error)
{
    auto registry = std::make_shared<LayoutRegistry>();
    if(!registry->loadFromString(xml, error))
    {
        return nullptr;
    }
    return registry;
}

void LayoutRegistry::clear()
{
    version_.clear();
    layouts_.clear();
    tag_index_.clear();
}

bool LayoutRegistry::loadFromFile(const std::string &path, std::string *error)
{
    clear();

    tinyxml2::XMLDocument doc;
    if(doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS)
    {
        if(error)
        {
            std::ostringstream oss;
            oss << "Failed to load XML: " << path << " (" << doc.ErrorStr() << ")";
            *error = oss.str();
        }
        return false;
    }

    std::string local_error;
    if(!loadDocument(doc, &local_error))
    {
        if(error)
        {
            *error = local_error + " in " + path;
        }
        return false;
    }
    return true;
}

bool LayoutRegistry::loadFromString(const std::string &xml, std::string *error)
{
    clear();

    tinyxml2::XMLDocument doc;
    if(doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS)
    {
        if(error)
        {
            std::ostringstream oss;
            oss << "Malformed layout XML: " << doc.ErrorStr();
            *error = oss.str();
        }
        return false;
    }
    return loadDocument(doc, error);
}

bool LayoutRegistry::loadDocument(const tinyxml2::XMLDocument &doc, std::string *error)
{
    auto fail = [this, error](std::string message)
    {
        clear();
        if(error)
        {
            *error = std::move(message);
        }
        return false;
    };

    const tinyxml2::XMLElement *root = doc.FirstChildElement("pa2");
    if(!root)
    {
        return fail("Missing <pa2> root element");
    }
    version_ = attributeOrEmpty(root, "version");

    const tinyxml2::XMLElement *records = root->FirstChildElement("records");
    if(!records)
    {
        return fail("Missing <records> element");
    }

    for(const tinyxml2::XMLElement *record = records->FirstChildElement("record"); record;
        record                             = record->NextSiblingElement("record"))
    {
        RecordLayout layout;
        if(std::optional<std::string> failure = parseRecord(record, layout))
        {
            return fail(std::move(*failure));
        }

        const std::size_t key = record_tag_key(layout.tag).hash();
        if(tag_index_.contains(key))
        {
            return fail("Duplicate record tag '" + layout.tag + "'");
        }
        tag_index_.emplace(key, layouts_.size());
        layouts_.push_back(std::move(layout));
    }

    if(layouts_.empty())
    {
        return fail("No record layouts defined");
    }
    return true;
}

const RecordLayout *LayoutRegistry::layoutByTag(const std::string_view tag) const
{
    if(tag.size() < record_tag_key::width)
    {
        return nullptr;
    }
    const auto it = tag_index_.find(record_tag_key(tag).hash());
    if(it == tag_index_.end())
    {
        return nullptr;
    }
    return &layouts_[it->second];
}

std::vector<std::string> LayoutRegistry::tags() const
{
    std::vector<std::string> result;
    result.reserve(layouts_.size());
    for(const auto &layout: layouts_)
    {
        result.push_back(layout.tag);
    }
    return result;
}

}  // namespace pa2
