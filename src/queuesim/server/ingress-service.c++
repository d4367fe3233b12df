// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "ingress-service.h"

#include <queuesim/queue/limits.h>
#include <queuesim/queue/queue.capnp.h>
#include <queuesim/util/exception.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/compat/url.h>
#include <kj/debug.h>

namespace queuesim::server {

namespace {

constexpr kj::StringPtr HDR_MSG_FORMAT = "X-Msg-Fmt"_kj;
constexpr kj::StringPtr HDR_BATCH_COUNT = "CF-Queue-Batch-Count"_kj;
constexpr kj::StringPtr HDR_BATCH_BYTES = "CF-Queue-Batch-Bytes"_kj;
constexpr kj::StringPtr HDR_LARGEST_MSG = "CF-Queue-Largest-Msg"_kj;

kj::StringPtr statusTextFor(uint statusCode) {
  switch (statusCode) {
    case HTTP_BAD_REQUEST:
      return "Bad Request"_kj;
    case HTTP_PAYLOAD_TOO_LARGE:
      return "Payload Too Large"_kj;
    default:
      return "Error"_kj;
  }
}

}  // namespace

IngressService::IngressService(
    QueueBroker& broker, kj::HttpHeaderTable::Builder& headerTableBuilder)
    : broker(broker),
      headerTable(headerTableBuilder.getFutureTable()),
      messageFormatHeaderId(headerTableBuilder.add(HDR_MSG_FORMAT)),
      batchCountHeaderId(headerTableBuilder.add(HDR_BATCH_COUNT)),
      batchBytesHeaderId(headerTableBuilder.add(HDR_BATCH_BYTES)),
      largestMessageHeaderId(headerTableBuilder.add(HDR_LARGEST_MSG)) {}

kj::Promise<void> IngressService::request(kj::HttpMethod method,
    kj::StringPtr url,
    const kj::HttpHeaders& headers,
    kj::AsyncInputStream& requestBody,
    Response& response) {
  // Path components come back already percent-decoded.
  kj::Vector<kj::String> path;
  KJ_IF_SOME(parsedUrl, kj::Url::tryParse(url, kj::Url::HTTP_REQUEST)) {
    path = kj::mv(parsedUrl.path);
  } else {
    co_return co_await response.sendError(400, "Bad Request", headerTable);
  }

  if (path.size() != 2 || (path[1] != "message" && path[1] != "batch")) {
    co_return co_await response.sendError(404, "Not Found", headerTable);
  }
  if (method != kj::HttpMethod::POST) {
    co_return co_await response.sendError(405, "Method Not Allowed", headerTable);
  }

  kj::StringPtr queueName = path[0];
  kj::Maybe<kj::Exception> failure;
  KJ_TRY {
    if (path[1] == "message") {
      co_await enqueueMessage(queueName, headers, requestBody);
    } else {
      co_await enqueueBatch(queueName, headers, requestBody);
    }
  } KJ_CATCH (kj::Exception& exception) {
    failure = kj::mv(exception);
  }

  KJ_IF_SOME(exception, failure) {
    co_return co_await sendException(response, kj::mv(exception));
  }
  co_return co_await sendText(response, 200, "OK", ""_kj);
}

kj::Promise<void> IngressService::enqueueMessage(
    kj::StringPtr queueName, const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody) {
  // Reject an oversized message before reading it.
  KJ_IF_SOME(length, requestBody.tryGetLength()) {
    validateMessageSize(length);
  }

  auto body = co_await requestBody.readAllBytes();
  broker.enqueueOne(queueName, kj::mv(body), headers.get(messageFormatHeaderId));
}

kj::Promise<void> IngressService::enqueueBatch(
    kj::StringPtr queueName, const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody) {
  // The producer declares the batch's shape up front so it can be refused without parsing.
  validateBatchSize(BatchDescriptor{
    .count = parseSizeHeader(headers, batchCountHeaderId),
    .largestMessage = parseSizeHeader(headers, largestMessageHeaderId),
    .totalBytes = parseSizeHeader(headers, batchBytesHeaderId),
  });

  auto text = co_await requestBody.readAllText();

  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<rpc::QueueBatchRequest>();
  capnp::JsonCodec codec;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { codec.decode(text, root); })) {
    QUEUESIM_FAIL_HTTP(
        HTTP_BAD_REQUEST, "batch request is not valid JSON: ", exception.getDescription());
  }

  auto messages = root.asReader().getMessages();
  if (messages.size() == 0) {
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "batch request must contain at least one message");
  }

  auto incoming = kj::heapArrayBuilder<IncomingMessage>(messages.size());
  for (auto wire: messages) {
    incoming.add(IncomingMessage::fromWire(wire));
  }
  broker.enqueueBatch(queueName, incoming.finish());
}

kj::Maybe<size_t> IngressService::parseSizeHeader(
    const kj::HttpHeaders& headers, kj::HttpHeaderId id) {
  KJ_IF_SOME(value, headers.get(id)) {
    KJ_IF_SOME(size, value.tryParseAs<size_t>()) {
      return size;
    }
    QUEUESIM_FAIL_HTTP(HTTP_BAD_REQUEST, "invalid ", id.toString(), " header: ", value);
  }
  return kj::none;
}

kj::Promise<void> IngressService::sendText(
    Response& response, uint statusCode, kj::StringPtr statusText, kj::StringPtr body) {
  kj::HttpHeaders responseHeaders(headerTable);
  if (body.size() > 0) {
    responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "text/plain;charset=UTF-8");
  }
  auto stream = response.send(statusCode, statusText, responseHeaders, uint64_t(body.size()));
  if (body.size() > 0) {
    co_await stream->write(body.asBytes());
  }
}

kj::Promise<void> IngressService::sendException(Response& response, kj::Exception&& exception) {
  KJ_IF_SOME(status, getHttpStatus(exception)) {
    co_return co_await sendText(
        response, status, statusTextFor(status), exception.getDescription());
  }

  if (exception.getType() == kj::Exception::Type::DISCONNECTED) {
    co_return co_await sendText(
        response, 503, "Service Unavailable", exception.getDescription());
  }

  KJ_LOG(ERROR, kj::str("Queue request failed: ", exception));
  co_return co_await sendText(response, 500, "Internal Server Error", "Internal Server Error");
}

}  // namespace queuesim::server
