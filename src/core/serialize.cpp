// REFINDEX - Serialization Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/core/serialize.h"

namespace refindex {

// ============================================================================
// DataStream Implementation
// ============================================================================

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + read_pos_, data_.size() - read_pos_);
}

} // namespace refindex
