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
 * @file record.hpp
 * @brief Record implementations.
 */

#include "record.h"
#include <cassert>
#include <stdexcept>

namespace csvio {

    inline std::string_view Record::field(size_t index) const {
        if constexpr (RANGE_CHECKING) {
            if (index >= complete_) {
                throw std::out_of_range("Field index " + std::to_string(index) +
                                        " out of range (record has " + std::to_string(complete_) + " fields)");
            }
        }
        assert(index < complete_ && "Access to an incomplete field");
        return buffers_[index];
    }

    inline std::optional<std::string_view> Record::fieldOrNone(size_t index) const {
        if (index >= complete_) {
            return std::nullopt;
        }
        return std::string_view(buffers_[index]);
    }

    /// Reset to zero fields; buffers keep their capacity
    inline void Record::clear() {
        complete_ = 0;
        for (auto& buf : buffers_) {
            buf.clear();
        }
    }

    /// Mark the field being built as complete. Adds an empty field if none is being built.
    inline void Record::pushField() {
        incompleteField();
        ++complete_;
    }

    inline void Record::appendByte(char octet) {
        incompleteField().push_back(octet);
    }

    inline void Record::appendBytes(std::string_view bytes) {
        incompleteField().append(bytes);
    }

    /// The field being built (buffers_[complete_]), allocated on first use
    inline Record::Buffer& Record::incompleteField() {
        assert(buffers_.size() >= complete_);
        if (buffers_.size() == complete_) {
            buffers_.emplace_back().reserve(FIELD_RESERVE);
        }
        return buffers_[complete_];
    }

} // namespace csvio
