/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the CSVIO library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/**
 * @file csvio.h
 * @brief CSVIO Library - Main Header with Declarations
 * 
 * A C++20 header-only library for streaming RFC 4180 CSV decoding and
 * encoding over arbitrary byte sources and sinks.
 * 
 * This header includes all CSVIO component declarations:
 * - Dialect: delimiter, quote, terminator and BOM configuration
 * - Record: reusable field buffers for one record
 * - Reader: state-machine decoder (one Record per call)
 * - Writer: escaping encoder
 * - Byte streams: std::istream / std::ostream / memory adapters
 */

// Core definitions first
#include "definitions.h"

// Core component declarations
#include "dialect.h"
#include "stream_concept.h"
#include "byte_stream.h"
#include "record.h"
#include "reader.h"
#include "writer.h"

// Include implementations
#include "byte_stream.hpp"
#include "record.hpp"
#include "reader.hpp"
#include "writer.hpp"
