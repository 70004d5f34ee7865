/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the CSVIO library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the CSVIO library */
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#ifndef CSVIO_DEBUG_OUTPUTS
#define CSVIO_DEBUG_OUTPUTS 0
#endif

#ifndef CSVIO_RANGE_CHECKING
#define CSVIO_RANGE_CHECKING 1
#endif

namespace csvio {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." + 
               std::to_string(VERSION_MINOR) + "." + 
               std::to_string(VERSION_PATCH);
    }

    // Diagnostics to std::cerr (warnings, stream failures)
    constexpr bool DEBUG_OUTPUTS  = CSVIO_DEBUG_OUTPUTS != 0;

    // Checked field access: Record::field() throws std::out_of_range instead of asserting
    constexpr bool RANGE_CHECKING = CSVIO_RANGE_CHECKING != 0;

    // Special octets
    constexpr char CR = '\r';
    constexpr char LF = '\n';
    constexpr char DEFAULT_DELIMITER = ',';
    constexpr char DEFAULT_QUOTE     = '"';

    // UTF-8 encoding of U+FEFF
    constexpr unsigned char BOM_BYTE_1 = 0xEF;
    constexpr unsigned char BOM_BYTE_2 = 0xBB;
    constexpr unsigned char BOM_BYTE_3 = 0xBF;
    constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

    // Initial capacity reserved for a freshly allocated field buffer
    constexpr size_t FIELD_RESERVE = 32;

} // namespace csvio
