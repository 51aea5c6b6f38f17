/*
 * File Name:   src/examples.cc
 * Description: CLI examples for decoding PA2 risk parameter records.
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

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace
{

struct DecodeSummary
{
    std::size_t                        decoded = 0;
    std::size_t                        failed  = 0;
    std::map<std::string, std::size_t> per_type;
};

std::string layoutPath(int argc, char **argv)
{
    if(argc > 1)
    {
        return argv[1];
    }
    if(const char *from_env = std::getenv("PA2_LAYOUT_FILE"); from_env && *from_env)
    {
        return from_env;
    }
    return "data/pa2/pa2_layouts.xml";
}

void printRiskArray(const pa2::DecodedRecord &record)
{
    const auto *risk = record["risk"].as<std::vector<double>>();
    if(!risk)
    {
        return;
    }

    std::cout << "  risk scenarios:";
    for(const double value: *risk)
    {
        std::cout << " " << pa2::formatFieldValue(value);
    }
    std::cout << "\n";
}

void printCurrencyConversion(const pa2::DecodedRecord &record)
{
    const auto *from = record["from_iso"].as<std::string>();
    const auto *to   = record["to_iso"].as<std::string>();
    const auto *rate = record["rate"].as<double>();
    if(from && to && rate)
    {
        std::cout << "  1 " << *from << " = " << pa2::formatFieldValue(*rate) << " " << *to << "\n";
    }
}

void decodeStream(const pa2::Decoder &decoder, std::istream &in, DecodeSummary &summary)
{
    std::string line;
    std::size_t line_number = 0;
    while(std::getline(in, line))
    {
        ++line_number;
        if(!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if(line.empty() || line.front() == '#')
        {
            continue;
        }

        pa2::DecodedRecord record;
        pa2::DecodeError   error;
        if(!decoder.decodeLine(line, record, error))
        {
            ++summary.failed;
            std::cerr << "Line " << line_number << ": " << pa2::Decoder::decodeErrorText(error) << "\n";
            continue;
        }

        ++summary.decoded;
        ++summary.per_type[std::string(record.typeName())];
        std::cout << record.toString() << "\n";

        if(record.tag() == "T ")
        {
            printCurrencyConversion(record);
        }
        else if(record.tag() == "81" || record.tag() == "82")
        {
            printRiskArray(record);
        }
    }
}

void printSummary(const DecodeSummary &summary)
{
    std::cout << "\n=== Summary ===\n";
    std::cout << "Decoded: " << summary.decoded << " Failed: " << summary.failed << "\n";
    for(const auto &[type_name, count]: summary.per_type)
    {
        std::cout << "  " << type_name << ": " << count << "\n";
    }
}

}  // namespace

int main(int argc, char **argv)
{
    const std::string layout_file = layoutPath(argc, argv);

    pa2::Decoder decoder;
    std::string  error;
    if(!decoder.loadLayoutsFromFile(layout_file, &error))
    {
        std::cerr << "Layout load warning: " << error << "\n";
        return 1;
    }

    std::cout << "Layout file: " << layout_file << " (version " << decoder.layouts().version() << ", "
              << decoder.layouts().size() << " record types)\n";

    DecodeSummary summary;
    if(argc > 2)
    {
        std::ifstream in(argv[2]);
        if(!in)
        {
            std::cerr << "Cannot open record file: " << argv[2] << "\n";
            return 1;
        }
        decodeStream(decoder, in, summary);
    }
    else
    {
        decodeStream(decoder, std::cin, summary);
    }

    printSummary(summary);
    return summary.failed == 0 ? 0 : 2;
}
