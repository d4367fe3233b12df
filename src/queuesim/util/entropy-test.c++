// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "entropy.h"

#include <kj/random.h>
#include <kj/test.h>

namespace queuesim {
namespace {

KJ_TEST("Mock entropy source (uses a counter)") {
  kj::byte buffer[10];
  auto mock = getMockEntropySource();
  mock->generate(buffer);
  for (int i = 0; i < 10; i++) {
    KJ_ASSERT(buffer[i] == i);
  }
  mock->generate(buffer);
  for (int i = 0; i < 10; i++) {
    KJ_ASSERT(buffer[i] == i + 10);
  }
}

KJ_TEST("Mock entropy source (uses a fixed byte)") {
  kj::byte buffer[10];
  auto mock = getMockEntropySource(kj::byte('a'));
  mock->generate(buffer);
  for (int i = 0; i < 10; i++) {
    KJ_ASSERT(buffer[i] == 'a');
  }
}

KJ_TEST("getEntropy fills buffers larger than its internal pool") {
  auto buffer = kj::heapArray<kj::byte>(10000);
  for (auto& b: buffer) b = 0;
  getEntropy(buffer);

  // 10000 zero bytes from a CSPRNG is not going to happen.
  bool allZero = true;
  for (auto b: buffer) {
    if (b != 0) allZero = false;
  }
  KJ_EXPECT(!allZero);
}

KJ_TEST("message ids are 32 lowercase hex digits") {
  auto mock = getMockEntropySource();
  KJ_EXPECT(randomMessageId(*mock) == "000102030405060708090a0b0c0d0e0f");
  KJ_EXPECT(randomMessageId(*mock) == "101112131415161718191a1b1c1d1e1f");

  auto id = randomMessageId();
  KJ_EXPECT(id.size() == 32);
  for (char c: id) {
    KJ_EXPECT((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'), id);
  }
  KJ_EXPECT(randomMessageId() != id);
}

}  // namespace
}  // namespace queuesim
