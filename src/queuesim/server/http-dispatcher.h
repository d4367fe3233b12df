// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <queuesim/queue/queue.h>

#include <kj/compat/http.h>

namespace queuesim::server {

// Delivers batches to a consumer service over HTTP. Each batch is POSTed to `url` as a JSON
// QueueDispatchRequest and the service answers with a JSON QueueResponse. Any status other than
// 200 fails the whole batch.
class HttpQueueDispatcher final: public QueueDispatcher {
 public:
  HttpQueueDispatcher(
      kj::Own<kj::HttpClient> client, const kj::HttpHeaderTable& headerTable, kj::String url);

  kj::Promise<QueueResponse> dispatch(
      kj::StringPtr queueName, kj::Array<SerializedMessage> messages) override;

  kj::StringPtr getUrl() const {
    return url;
  }

 private:
  kj::Own<kj::HttpClient> client;
  const kj::HttpHeaderTable& headerTable;
  kj::String url;
};

kj::String encodeDispatchRequest(
    kj::StringPtr queueName, kj::ArrayPtr<const SerializedMessage> messages);

// A missing or empty `outcome` counts as "ok". A name that isn't an EventOutcome is UNKNOWN.
QueueResponse decodeQueueResponse(kj::StringPtr json);

}  // namespace queuesim::server
