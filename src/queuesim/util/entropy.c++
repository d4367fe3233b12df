// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "entropy.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/exception.h>
#include <kj/random.h>

namespace queuesim {

namespace {

class MockEntropySource final: public kj::EntropySource {
 public:
  explicit MockEntropySource(kj::Maybe<kj::byte> fill): fill(fill) {}

  void generate(kj::ArrayPtr<kj::byte> buffer) override {
    for (kj::byte& b: buffer) {
      KJ_IF_SOME(f, fill) {
        b = f;
      } else {
        b = counter++;
      }
    }
  }

 private:
  kj::Maybe<kj::byte> fill;
  kj::byte counter = 0;
};

}  // namespace

void getEntropy(kj::ArrayPtr<kj::byte> output) {
  static constexpr size_t BUFFER_SIZE = 4096;
  struct BufferState {
    kj::FixedArray<kj::byte, BUFFER_SIZE> store;
    kj::ArrayPtr<kj::byte> data;  // Starts empty to trigger initial fill
  };

  thread_local BufferState state{};

  while (output != nullptr) {
    if (state.data == nullptr) {
      if (RAND_bytes(state.store.begin(), BUFFER_SIZE) != 1) {
        ERR_clear_error();
        KJ_FAIL_REQUIRE("RAND_bytes failed to generate random data");
      }

      state.data = state.store.asPtr();
    }

    size_t toCopy = kj::min(state.data.size(), output.size());
    output.first(toCopy).copyFrom(state.data.first(toCopy));
    OPENSSL_cleanse(state.data.first(toCopy).begin(), toCopy);
    state.data = state.data.slice(toCopy);
    output = output.slice(toCopy);
  }
}

kj::String randomMessageId(kj::Maybe<kj::EntropySource&> entropySource) {
  kj::FixedArray<kj::byte, 16> bytes;
  KJ_IF_SOME(source, entropySource) {
    source.generate(bytes.asPtr());
  } else {
    getEntropy(bytes.asPtr());
  }
  return kj::encodeHex(bytes.asPtr());
}

kj::Own<kj::EntropySource> getMockEntropySource(kj::Maybe<kj::byte> fill) {
  return kj::heap<MockEntropySource>(fill);
}

}  // namespace queuesim
