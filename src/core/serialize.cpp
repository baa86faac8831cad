// STARDUST - Serialization Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/serialize.h"
#include "stardust/core/hex.h"

namespace stardust {

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + read_pos_, data_.size() - read_pos_);
}

} // namespace stardust
