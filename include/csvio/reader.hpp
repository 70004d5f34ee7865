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
 * @file reader.hpp
 * @brief Reader template implementations.
 */

#include "reader.h"
#include "record.hpp"
#include <exception>
#include <iostream>
#include <utility>

namespace csvio {

    // ── Constructor ─────────────────────────────────────────────────────

    template<ByteSourceConcept Source>
    Reader<Source>::Reader(Source source, const Dialect& dialect)
        : source_(std::move(source))
        , dialect_(dialect)
        , state_(dialect.skipsBom() ? State::EAT_BOM_1 : State::BEFORE_RECORD)
    {
        if (dialect_.hasCollisions()) {
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "Warning: CSV dialect uses the same octet for more than one of "
                             "delimiter, quote and terminator; parsing is implementation-defined"
                          << std::endl;
            }
        }
    }

    // ── Reading ─────────────────────────────────────────────────────────

    /// Decode the next record into @p record.
    /// Returns false once the input is exhausted; source errors are rethrown unchanged.
    template<ByteSourceConcept Source>
    bool Reader<Source>::readNext(Record& record) {
        record.setLineNo(line_no_);
        record.clear();

        try {
            if (!decode(record)) {
                return false;
            }
        } catch (const std::exception& ex) {
            err_msg_ = "Error: Failed to read CSV input at line " + std::to_string(line_no_) +
                       ": " + ex.what();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            throw;
        }

        record_cnt_++;
        return true;
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Fetch one octet and advance the physical line counter
    template<ByteSourceConcept Source>
    bool Reader<Source>::getByte(char& octet) {
        if (!source_.readByte(octet)) {
            return false;
        }

        if (octet == CR) {
            line_no_++;
            seen_cr_ = true;
        } else if (octet == LF && !seen_cr_) {
            line_no_++;
        } else {
            seen_cr_ = false;
        }
        return true;
    }

    /// Run the state machine until a record is complete or the input ends
    template<ByteSourceConcept Source>
    bool Reader<Source>::decode(Record& record) {
        const char       delimiter  = dialect_.delimiter;
        const bool       quoting    = dialect_.quote.has_value();
        const char       quote      = dialect_.quote.value_or('\0');
        const Terminator terminator = dialect_.terminator;

        char c = 0;
        while (getByte(c)) {
            // Lookahead states: either consume the octet or hand it on to the field states below
            switch (state_) {
                case State::EAT_BOM_1:
                    if (static_cast<unsigned char>(c) == BOM_BYTE_1) {
                        state_ = State::EAT_BOM_2;
                        continue;
                    }
                    state_ = State::BEFORE_RECORD;
                    break;

                case State::EAT_BOM_2:
                    if (static_cast<unsigned char>(c) == BOM_BYTE_2) {
                        state_ = State::EAT_BOM_3;
                        continue;
                    }
                    // Not a BOM: the consumed prefix is field data
                    record.appendBytes(UTF8_BOM.substr(0, 1));
                    state_ = State::IN_FIELD;
                    break;

                case State::EAT_BOM_3:
                    if (static_cast<unsigned char>(c) == BOM_BYTE_3) {
                        state_ = State::BEFORE_RECORD;
                        continue;
                    }
                    record.appendBytes(UTF8_BOM.substr(0, 2));
                    state_ = State::IN_FIELD;
                    break;

                case State::EAT_LF:
                    state_ = State::BEFORE_RECORD;
                    if (c == LF) {
                        continue;
                    }
                    break;

                default:
                    break;
            }

            if (state_ == State::BEFORE_RECORD || state_ == State::BEFORE_FIELD) {
                if (quoting && c == quote) {
                    state_ = State::IN_QUOTED_FIELD;
                    continue;
                }
                state_ = State::IN_FIELD;
            } else if (state_ == State::QUOTE_IN_QUOTED) {
                if (c == quote) {
                    // Doubled quote: one literal quote, still inside the quoted run
                    record.appendByte(c);
                    state_ = State::IN_QUOTED_FIELD;
                    continue;
                }
                state_ = State::IN_FIELD;
            } else if (state_ == State::IN_QUOTED_FIELD) {
                if (c == quote) {
                    state_ = State::QUOTE_IN_QUOTED;
                } else {
                    record.appendByte(c);
                }
                continue;
            }

            // State::IN_FIELD
            if (c == delimiter) {
                record.pushField();
                state_ = State::BEFORE_FIELD;
                continue;
            }
            if (terminator.matches(c)) {
                state_ = (terminator.isCrlf() && c == CR) ? State::EAT_LF : State::BEFORE_RECORD;
                record.pushField();
                return true;
            }
            record.appendByte(c);
        }

        return finishAtEnd(record);
    }

    /// End of input: complete a pending record, if there is one
    template<ByteSourceConcept Source>
    bool Reader<Source>::finishAtEnd(Record& record) {
        switch (state_) {
            case State::BEFORE_RECORD:
            case State::EAT_LF:
            case State::EAT_BOM_1:
                return false;

            case State::EAT_BOM_2:
                record.appendBytes(UTF8_BOM.substr(0, 1));
                break;

            case State::EAT_BOM_3:
                record.appendBytes(UTF8_BOM.substr(0, 2));
                break;

            default:
                break;
        }

        state_ = State::BEFORE_RECORD;
        record.pushField();
        return true;
    }

} // namespace csvio
