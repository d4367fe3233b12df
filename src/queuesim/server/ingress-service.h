// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <queuesim/queue/broker.h>

#include <kj/compat/http.h>

namespace queuesim::server {

// HTTP front end for producers.
//
//   POST /<queue>/message   body is one message, X-Msg-Fmt names its content type
//   POST /<queue>/batch     body is a JSON QueueBatchRequest, with the CF-Queue-Batch-* headers
//                           declaring its shape
//
// Responds 200 with an empty body once the messages are buffered, or with the validation error's
// status and message as text.
class IngressService final: public kj::HttpService {
 public:
  // Registers the headers the service reads. The table built from `headerTableBuilder` must
  // outlive the service.
  IngressService(QueueBroker& broker, kj::HttpHeaderTable::Builder& headerTableBuilder);

  kj::Promise<void> request(kj::HttpMethod method,
      kj::StringPtr url,
      const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody,
      Response& response) override;

 private:
  QueueBroker& broker;
  const kj::HttpHeaderTable& headerTable;

  kj::HttpHeaderId messageFormatHeaderId;
  kj::HttpHeaderId batchCountHeaderId;
  kj::HttpHeaderId batchBytesHeaderId;
  kj::HttpHeaderId largestMessageHeaderId;

  kj::Promise<void> enqueueMessage(
      kj::StringPtr queueName, const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody);
  kj::Promise<void> enqueueBatch(
      kj::StringPtr queueName, const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody);

  kj::Maybe<size_t> parseSizeHeader(const kj::HttpHeaders& headers, kj::HttpHeaderId id);

  kj::Promise<void> sendText(
      Response& response, uint statusCode, kj::StringPtr statusText, kj::StringPtr body);
  kj::Promise<void> sendException(Response& response, kj::Exception&& exception);
};

}  // namespace queuesim::server
