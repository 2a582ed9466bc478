/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace equisim::util
{

//-------------------------------------------------------------------------

[[nodiscard]] pugi::xml_attribute requireAttribute(
    pugi::xml_node node, const char* name, std::string_view ctx);

[[nodiscard]] pugi::xml_document loadXML(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace equisim::util

//-------------------------------------------------------------------------
