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
 * @file record.h
 * @brief Record: one CSV record, an ordered list of fields plus its line number.
 *
 * A Record owns a growable list of growable byte buffers. Only the first
 * fieldCount() buffers hold valid ("complete") fields; buffers beyond that are
 * kept as spare capacity so that decoding many records through the same
 * Record becomes allocation-free after a short warm-up:
 *
 *     buffers_:  [ "pi" | "3.1416" | "" (spare) | "" (spare) ]
 *     complete_: 2
 *
 * clear() truncates every buffer but frees nothing. Memory is released when
 * the Record is destroyed.
 *
 * Usage:
 *     csvio::Record record;
 *     while (reader.readNext(record)) {
 *         for (size_t i = 0; i < record.fieldCount(); ++i) {
 *             std::string_view f = record.field(i);
 *         }
 *     }
 */

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"

namespace csvio {

    class Record {
    public:
        using Buffer            = std::string;
        using const_iterator    = std::vector<Buffer>::const_iterator;

    private:
        std::vector<Buffer>     buffers_;           // field buffers, size() >= complete_
        size_t                  complete_ = 0;      // number of complete fields at the front of buffers_
        size_t                  line_no_  = 0;      // first physical line of the record (1-based)

    public:
        Record() = default;
        Record(const Record&) = default;
        Record(Record&&) noexcept = default;
        Record& operator=(const Record&) = default;
        Record& operator=(Record&&) noexcept = default;
        ~Record() = default;

        // Field access
        size_t                  fieldCount() const              { return complete_; }
        bool                    empty() const                   { return complete_ == 0; }
        std::string_view        field(size_t index) const;
        std::optional<std::string_view> fieldOrNone(size_t index) const;
        std::span<const Buffer> fields() const                  { return {buffers_.data(), complete_}; }
        const_iterator          begin() const                   { return buffers_.begin(); }
        const_iterator          end() const                     { return buffers_.begin() + static_cast<std::ptrdiff_t>(complete_); }

        size_t                  lineNo() const                  { return line_no_; }
        void                    setLineNo(size_t lineNo)        { line_no_ = lineNo; }

        // Number of allocated buffers, including spare capacity
        size_t                  bufferCount() const             { return buffers_.size(); }

        // Building
        void                    clear();
        void                    pushField();
        void                    appendByte(char octet);
        void                    appendBytes(std::string_view bytes);

    private:
        Buffer&                 incompleteField();
    };

} // namespace csvio
