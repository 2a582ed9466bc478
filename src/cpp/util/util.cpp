/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace equisim::util
{

//-------------------------------------------------------------------------

pugi::xml_attribute requireAttribute(
    pugi::xml_node node, const char* name, std::string_view ctx)
{
    if (pugi::xml_attribute attr = node.attribute(name)) {
        return attr;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Missing required attribute '{}' on <{}>", ctx, name, node.name())};
}

//-------------------------------------------------------------------------

pugi::xml_document loadXML(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!fs::exists(path)) {
        throw std::invalid_argument{fmt::format("{}: No such file '{}'", ctx, path.c_str())};
    }

    pugi::xml_document doc;
    if (pugi::xml_parse_result parseResult = doc.load_file(path.c_str()); !parseResult) {
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing '{}' at offset {}: {}",
            ctx, path.c_str(), parseResult.offset, parseResult.description())};
    }
    return doc;
}

//-------------------------------------------------------------------------

}  // namespace equisim::util

//-------------------------------------------------------------------------
