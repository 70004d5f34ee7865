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
 * @file stream_concept.h
 * @brief ByteSourceConcept / ByteSinkConcept: C++20 concepts describing the
 *        minimal I/O surface required by csvio::Reader and csvio::Writer.
 *
 * Any transport (memory buffer, file, socket) qualifies by providing the
 * member functions below; no common base class is involved:
 *
 *     struct SocketSource {
 *         bool readByte(char& octet);   // false on end of stream, throws on error
 *     };
 *
 *     struct SocketSink {
 *         void writeAll(std::string_view bytes);   // throws on error
 *         void writeByte(char octet);              // throws on error
 *     };
 *
 * Sources and sinks should be buffered: the Reader pulls one octet per call and
 * the Writer pushes many small writes.
 */

#include <concepts>
#include <string_view>

namespace csvio {

    template<typename S>
    concept ByteSourceConcept = requires(S source, char& octet) {
        { source.readByte(octet)    }   -> std::convertible_to<bool>;
    };

    template<typename S>
    concept ByteSinkConcept = requires(S sink, std::string_view bytes, char octet) {
        { sink.writeAll(bytes)      };
        { sink.writeByte(octet)     };
    };

} // namespace csvio
