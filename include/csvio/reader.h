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
 * @file reader.h
 * @brief Reader: streaming RFC 4180 CSV decoder.
 *
 * Reader<Source> pulls single octets from any ByteSourceConcept type and
 * decodes one Record per readNext() call.
 *
 * Design:
 *   - Explicit state machine (enum class State), one transition per octet
 *   - No per-record allocation once the caller's Record has warmed up
 *   - Physical line tracking: CR, LF and CR LF each count as one line break
 *   - Configurable delimiter, quote and terminator octets (see Dialect)
 *   - Header-only implementation (reader.hpp)
 *
 * Deviations from RFC 4180 (all permissive, none reported as errors):
 *   1. Fields may contain any octet other than the special ones.
 *   2. A field may concatenate quoted and unquoted runs: "foo"bar reads as foobar.
 *   3. A quote inside an unquoted field is data: Foo "Bar" Baz is read verbatim.
 *   4. A leading EF BB BF may be discarded, depending on Dialect::bom. A partial
 *      BOM prefix is kept as data of the first field.
 *   5. In CRLF mode a sole CR or a sole LF also terminates a record.
 *   6. The last record does not need a terminator.
 *
 * Usage:
 *     std::ifstream in("data.csv", std::ios::binary);
 *     csvio::Reader reader{csvio::IStreamSource{in}};
 *     csvio::Record record;
 *     while (reader.readNext(record)) {
 *         std::cout << record.lineNo() << ": " << record.field(0) << "\n";
 *     }
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "definitions.h"
#include "dialect.h"
#include "record.h"
#include "stream_concept.h"

namespace csvio {

    template<ByteSourceConcept Source>
    class Reader {
    public:
        enum class State : uint8_t {
            BEFORE_RECORD,
            BEFORE_FIELD,
            IN_FIELD,
            IN_QUOTED_FIELD,
            QUOTE_IN_QUOTED,
            EAT_LF,
            EAT_BOM_1,
            EAT_BOM_2,
            EAT_BOM_3
        };

    private:
        std::string             err_msg_;               // last error message description
        Source                  source_;                // octet input
        Dialect                 dialect_;               // copied at construction, never modified

        State                   state_;                 // current parser state
        size_t                  line_no_ = 1;           // current physical line (1-based)
        bool                    seen_cr_ = false;       // previous octet was CR (CR LF counts once)
        uint64_t                record_cnt_ = 0;        // records decoded so far

    public:
        Reader() = delete;
        explicit Reader(Source source, const Dialect& dialect = Dialect{});

        bool                    readNext(Record& record);

        const Dialect&          dialect() const                 { return dialect_; }
        const std::string&      getErrorMsg() const             { return err_msg_; }
        size_t                  lineNo() const                  { return line_no_; }
        uint64_t                recordCount() const             { return record_cnt_; }
        State                   state() const                   { return state_; }
        Source&                 source()                        { return source_; }
        const Source&           source() const                  { return source_; }

    private:
        bool                    getByte(char& octet);
        bool                    decode(Record& record);
        bool                    finishAtEnd(Record& record);
    };

} // namespace csvio
