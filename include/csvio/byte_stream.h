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
 * @file byte_stream.h
 * @brief Ready-made byte sources and sinks for csvio::Reader / csvio::Writer.
 *
 *   - IStreamSource  reads from any std::istream (std::ifstream, std::cin, ...)
 *   - OStreamSink    writes to any std::ostream (std::ofstream, std::cout, ...)
 *   - MemorySource   reads from a caller-owned block of memory
 *   - StringSink     appends to a caller-owned std::string
 *
 * All adapters hold a non-owning reference: opening, flushing and closing the
 * underlying stream stays with the caller. Stream adapters throw
 * std::ios_base::failure when the stream reports an error (badbit); a stream
 * that has exceptions() enabled throws its own exception, which passes through
 * unchanged.
 */

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "stream_concept.h"

namespace csvio {

    class IStreamSource {
        std::istream*           is_;

    public:
        explicit IStreamSource(std::istream& is) : is_(&is) {}

        bool                    readByte(char& octet);
        std::istream&           stream() const                  { return *is_; }
    };

    class OStreamSink {
        std::ostream*           os_;

    public:
        explicit OStreamSink(std::ostream& os) : os_(&os) {}

        void                    writeAll(std::string_view bytes);
        void                    writeByte(char octet);
        std::ostream&           stream() const                  { return *os_; }
    };

    class MemorySource {
        std::string_view        data_;
        size_t                  pos_ = 0;

    public:
        explicit MemorySource(std::string_view data) : data_(data) {}

        bool readByte(char& octet) {
            if (pos_ >= data_.size()) {
                return false;
            }
            octet = data_[pos_++];
            return true;
        }

        size_t                  position() const                { return pos_; }
        size_t                  remaining() const               { return data_.size() - pos_; }
    };

    class StringSink {
        std::string*            out_;

    public:
        explicit StringSink(std::string& out) : out_(&out) {}

        void                    writeAll(std::string_view bytes){ out_->append(bytes); }
        void                    writeByte(char octet)           { out_->push_back(octet); }
        const std::string&      str() const                     { return *out_; }
    };

    static_assert(ByteSourceConcept<IStreamSource>, "IStreamSource must satisfy ByteSourceConcept");
    static_assert(ByteSourceConcept<MemorySource>,  "MemorySource must satisfy ByteSourceConcept");
    static_assert(ByteSinkConcept<OStreamSink>,     "OStreamSink must satisfy ByteSinkConcept");
    static_assert(ByteSinkConcept<StringSink>,      "StringSink must satisfy ByteSinkConcept");

} // namespace csvio
