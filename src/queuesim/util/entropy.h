// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace kj {
class EntropySource;
}

namespace queuesim {

// Fills `output` with cryptographically-random bytes.
void getEntropy(kj::ArrayPtr<kj::byte> output);

// Generates a fresh message id: 16 random bytes rendered as 32 lowercase hex digits. When
// `entropySource` is given it is used instead of the system CSPRNG, so tests get predictable ids.
kj::String randomMessageId(kj::Maybe<kj::EntropySource&> entropySource = kj::none);

// Returns an entropy source that yields 0, 1, 2, ... (wrapping), or `fill` repeated if given.
kj::Own<kj::EntropySource> getMockEntropySource(kj::Maybe<kj::byte> fill = kj::none);

}  // namespace queuesim
