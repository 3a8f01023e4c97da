// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */
#include "crypto/crypter.hpp"

namespace crypto {

Crypter::~Crypter() = default;

}  // namespace crypto
