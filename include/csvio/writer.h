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
 * @file writer.h
 * @brief Writer: streaming RFC 4180 CSV encoder.
 *
 * Writer<Sink> pushes octets to any ByteSinkConcept type.
 *
 * Design:
 *   - A field is quoted only if it contains the delimiter, the quote octet or
 *     a terminator octet (CR and LF in CRLF mode); embedded quotes are doubled
 *   - Fields needing no escaping are written verbatim with one writeAll()
 *   - The escape-trigger octets are computed once, at construction
 *   - Optional UTF-8 BOM, emitted before the first field of the stream
 *   - Header-only implementation (writer.hpp)
 *
 * A record is written either in one call (writeRecord) or field by field
 * (writeField ... terminateRecord). writeRecord() must not follow a
 * writeField() without terminateRecord() in between.
 *
 * Usage:
 *     std::string out;
 *     csvio::Writer writer{csvio::StringSink{out}};
 *     writer.writeRecord({"id", "name"});
 *     writer.writeField("1");
 *     writer.writeField("Smith, John");
 *     writer.terminateRecord();
 *     // out == "id,name\r\n1,\"Smith, John\"\r\n"
 */

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>

#include "definitions.h"
#include "dialect.h"
#include "stream_concept.h"

namespace csvio {

    template<ByteSinkConcept Sink>
    class Writer {
        std::string             err_msg_;               // last error message description
        Sink                    sink_;                  // octet output
        Dialect                 dialect_;               // copied at construction, never modified

        bool                    needs_bom_ = false;     // BOM still to be written
        bool                    needs_delimiter_ = false; // mid-record: next field is preceded by a delimiter
        std::array<char, 4>     escape_triggers_{};     // octets that force quoting
        uint64_t                record_cnt_ = 0;        // records terminated so far

    public:
        Writer() = delete;
        explicit Writer(Sink sink, const Dialect& dialect = Dialect{});

        void                    writeField(std::string_view field);
        void                    terminateRecord();

        template<std::ranges::input_range Range>
            requires std::convertible_to<std::ranges::range_reference_t<Range>, std::string_view>
        void                    writeRecord(Range&& fields);
        void                    writeRecord(std::initializer_list<std::string_view> fields);
        template<typename... Fields>
        void                    writeRecord(const std::tuple<Fields...>& fields);

        const Dialect&          dialect() const                 { return dialect_; }
        const std::string&      getErrorMsg() const             { return err_msg_; }
        bool                    isMidRecord() const             { return needs_delimiter_; }
        uint64_t                recordCount() const             { return record_cnt_; }
        bool                    needsEscaping(std::string_view field) const;
        Sink&                   sink()                          { return sink_; }
        const Sink&             sink() const                    { return sink_; }

    private:
        void                    beginRecord();
        void                    putBom();
        void                    putField(std::string_view field);
        void                    putTerminator();

        template<typename Fn>
        void                    guarded(Fn&& fn);
    };

} // namespace csvio
