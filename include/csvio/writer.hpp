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
 * @file writer.hpp
 * @brief Writer template implementations.
 */

#include "writer.h"
#include <exception>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace csvio {

    // ── Constructor ─────────────────────────────────────────────────────

    template<ByteSinkConcept Sink>
    Writer<Sink>::Writer(Sink sink, const Dialect& dialect)
        : sink_(std::move(sink))
        , dialect_(dialect)
        , needs_bom_(dialect.emitsBom())
    {
        escape_triggers_[0] = dialect_.delimiter;
        escape_triggers_[1] = dialect_.writeQuote();
        if (dialect_.terminator.isCrlf()) {
            escape_triggers_[2] = CR;
            escape_triggers_[3] = LF;
        } else {
            escape_triggers_[2] = dialect_.terminator.value();
            escape_triggers_[3] = dialect_.terminator.value();
        }

        if (dialect_.hasCollisions()) {
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "Warning: CSV dialect uses the same octet for more than one of "
                             "delimiter, quote and terminator; output may not read back unchanged"
                          << std::endl;
            }
        }
    }

    // ── Writing ─────────────────────────────────────────────────────────

    /// Append one field to the current record. Call terminateRecord() once all fields are written.
    template<ByteSinkConcept Sink>
    void Writer<Sink>::writeField(std::string_view field) {
        guarded([&] { putField(field); });
    }

    /// Write the record terminator (the terminator octet, or CR LF)
    template<ByteSinkConcept Sink>
    void Writer<Sink>::terminateRecord() {
        guarded([&] { putTerminator(); });
    }

    template<ByteSinkConcept Sink>
    template<std::ranges::input_range Range>
        requires std::convertible_to<std::ranges::range_reference_t<Range>, std::string_view>
    void Writer<Sink>::writeRecord(Range&& fields) {
        beginRecord();
        guarded([&] {
            for (auto&& field : fields) {
                putField(std::string_view(field));
            }
            putTerminator();
        });
    }

    template<ByteSinkConcept Sink>
    void Writer<Sink>::writeRecord(std::initializer_list<std::string_view> fields) {
        beginRecord();
        guarded([&] {
            for (std::string_view field : fields) {
                putField(field);
            }
            putTerminator();
        });
    }

    template<ByteSinkConcept Sink>
    template<typename... Fields>
    void Writer<Sink>::writeRecord(const std::tuple<Fields...>& fields) {
        static_assert((std::is_convertible_v<const Fields&, std::string_view> && ...),
                      "writeRecord: every tuple element must be convertible to std::string_view");
        beginRecord();
        guarded([&] {
            std::apply([this](const auto&... field) {
                (putField(std::string_view(field)), ...);
            }, fields);
            putTerminator();
        });
    }

    template<ByteSinkConcept Sink>
    bool Writer<Sink>::needsEscaping(std::string_view field) const {
        return field.find_first_of(std::string_view(escape_triggers_.data(), escape_triggers_.size()))
               != std::string_view::npos;
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// writeRecord() must start on a record boundary
    template<ByteSinkConcept Sink>
    void Writer<Sink>::beginRecord() {
        if (needs_delimiter_) {
            err_msg_ = "Error: writeRecord() called while a record started by writeField() "
                       "is not terminated; call terminateRecord() first";
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            throw std::logic_error(err_msg_);
        }
    }

    template<ByteSinkConcept Sink>
    void Writer<Sink>::putBom() {
        if (needs_bom_) {
            sink_.writeAll(UTF8_BOM);
            needs_bom_ = false;
        }
    }

    template<ByteSinkConcept Sink>
    void Writer<Sink>::putField(std::string_view field) {
        putBom();

        if (needs_delimiter_) {
            sink_.writeByte(dialect_.delimiter);
        }
        needs_delimiter_ = true;

        if (!needsEscaping(field)) {
            sink_.writeAll(field);
            return;
        }

        const char quote = dialect_.writeQuote();
        sink_.writeByte(quote);
        for (char c : field) {
            if (c == quote) {
                sink_.writeByte(c);
            }
            sink_.writeByte(c);
        }
        sink_.writeByte(quote);
    }

    template<ByteSinkConcept Sink>
    void Writer<Sink>::putTerminator() {
        putBom();
        needs_delimiter_ = false;
        if (dialect_.terminator.isCrlf()) {
            sink_.writeAll("\r\n");
        } else {
            sink_.writeByte(dialect_.terminator.value());
        }
        record_cnt_++;
    }

    /// Run a sink operation; on failure remember and log the message, then rethrow unchanged
    template<ByteSinkConcept Sink>
    template<typename Fn>
    void Writer<Sink>::guarded(Fn&& fn) {
        try {
            fn();
        } catch (const std::exception& ex) {
            err_msg_ = std::string("Error: Failed to write CSV output: ") + ex.what();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            throw;
        }
    }

} // namespace csvio
