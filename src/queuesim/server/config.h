// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <queuesim/server/queuesim.capnp.h>

#include <capnp/message.h>
#include <kj/array.h>
#include <kj/string.h>
#include <kj/time.h>

namespace queuesim::server {

// A consumer from the config file, validated, with defaults filled in and its service resolved.
struct ConsumerConfig {
  kj::String queueName;
  uint maxBatchSize;
  kj::Duration maxBatchTimeout;
  uint maxRetries;
  kj::Maybe<kj::String> deadLetterQueue;
  kj::String serviceName;
  kj::String serviceUrl;
};

constexpr uint MAX_BATCH_SIZE_LIMIT = 100;
constexpr double MAX_BATCH_TIMEOUT_LIMIT_SECONDS = 30;
constexpr uint MAX_RETRIES_LIMIT = 100;

// Decodes a JSON config into `message`. Throws if the text isn't valid JSON for the schema.
config::Config::Reader parseConfig(kj::StringPtr json, capnp::MallocMessageBuilder& message);

// Validates every queue's consumer. Throws a FAILED exception describing the first problem.
kj::Array<ConsumerConfig> parseConsumers(config::Config::Reader config);

// Converts a fractional number of seconds to a duration with millisecond precision.
kj::Duration secondsToDuration(double seconds);

}  // namespace queuesim::server
