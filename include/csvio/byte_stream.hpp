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
 * @file byte_stream.hpp
 * @brief Stream adapter implementations.
 */

#include "byte_stream.h"
#include <ios>
#include <streambuf>

namespace csvio {

    inline bool IStreamSource::readByte(char& octet) {
        // Raw octets: go straight to the streambuf, skipping the sentry of istream::get()
        std::streambuf* buf = is_->rdbuf();
        if (buf == nullptr || is_->bad() || (is_->fail() && !is_->eof())) {
            throw std::ios_base::failure("Error: Input stream is in a failed state");
        }
        if (is_->eof()) {
            return false;
        }

        const auto c = buf->sbumpc();
        if (std::char_traits<char>::eq_int_type(c, std::char_traits<char>::eof())) {
            is_->setstate(std::ios::eofbit);
            return false;
        }
        octet = std::char_traits<char>::to_char_type(c);
        return true;
    }

    inline void OStreamSink::writeAll(std::string_view bytes) {
        os_->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (os_->bad()) {
            throw std::ios_base::failure("Error: Failed to write to output stream");
        }
    }

    inline void OStreamSink::writeByte(char octet) {
        os_->put(octet);
        if (os_->bad()) {
            throw std::ios_base::failure("Error: Failed to write to output stream");
        }
    }

} // namespace csvio
