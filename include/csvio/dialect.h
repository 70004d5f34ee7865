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
 * @file dialect.h
 * @brief Dialect: special octets used by csvio::Reader and csvio::Writer.
 *
 * A default Dialect (`csvio::Dialect{}`) is fully compatible with RFC 4180:
 * comma delimiter, double-quote quoting, CR LF terminator.
 *
 * Usage:
 *     csvio::Dialect tsv{ .delimiter = '\t', .quote = std::nullopt,
 *                         .terminator = csvio::Terminator::octet('\n') };
 *
 * Delimiter, quote and terminator octets should be distinct. Colliding octets
 * are accepted (construction never fails) but the resulting parse is
 * implementation-defined; see hasCollisions().
 */

#include <cstdint>
#include <optional>

#include "definitions.h"

namespace csvio {

    /**
     * @brief Record terminator: a specific octet, or the CR LF sequence.
     *
     * In CRLF mode the Writer always emits CR LF, while the Reader accepts a
     * sole CR, a sole LF or CR LF as the end of a record.
     */
    class Terminator {
    public:
        enum class Kind : uint8_t {
            OCTET = 0x01,
            CRLF  = 0x02
        };

    private:
        Kind                    kind_  = Kind::CRLF;
        char                    octet_ = LF;        // only meaningful for Kind::OCTET

        constexpr Terminator(Kind kind, char octet) : kind_(kind), octet_(octet) {}

    public:
        constexpr Terminator() = default;

        static constexpr Terminator crlf()              { return Terminator(Kind::CRLF, LF); }
        static constexpr Terminator octet(char value)   { return Terminator(Kind::OCTET, value); }

        constexpr Kind          kind() const            { return kind_; }
        constexpr bool          isCrlf() const          { return kind_ == Kind::CRLF; }
        constexpr char          value() const           { return octet_; }

        /// True if @p c ends a record when read
        constexpr bool matches(char c) const {
            return isCrlf() ? (c == CR || c == LF) : (c == octet_);
        }

        constexpr bool operator==(const Terminator& other) const {
            return kind_ == other.kind_ && (isCrlf() || octet_ == other.octet_);
        }
    };

    struct Dialect {
        /// Octet separating fields within a record (COMMA rule of RFC 4180)
        char                    delimiter  = DEFAULT_DELIMITER;

        /// Octet enclosing fields with special octets (DQUOTE rule of RFC 4180).
        /// std::nullopt disables quote handling in the Reader; the Writer then
        /// falls back to '"' when a field needs escaping.
        std::optional<char>     quote      = DEFAULT_QUOTE;

        /// Record terminator (CRLF rule of RFC 4180)
        Terminator              terminator = Terminator::crlf();

        /// Byte order mark policy:
        ///   std::nullopt  Reader discards a leading BOM, Writer emits none
        ///   true          Reader discards a leading BOM, Writer emits one
        ///   false         Reader keeps a BOM as data of the first field, Writer emits none
        std::optional<bool>     bom        = std::nullopt;

        /// Quote octet used by the Writer
        constexpr char writeQuote() const { return quote.value_or(DEFAULT_QUOTE); }

        /// Reader discards a leading BOM unless bom == false
        constexpr bool skipsBom() const { return bom.value_or(true); }

        /// Writer emits a BOM only if bom == true
        constexpr bool emitsBom() const { return bom.value_or(false); }

        /// True if delimiter, quote and terminator octets are not pairwise distinct
        constexpr bool hasCollisions() const {
            const char q = writeQuote();
            if (delimiter == q) return true;
            if (terminator.isCrlf()) {
                return delimiter == CR || delimiter == LF || q == CR || q == LF;
            }
            return delimiter == terminator.value() || q == terminator.value();
        }

        constexpr bool operator==(const Dialect&) const = default;
    };

} // namespace csvio
