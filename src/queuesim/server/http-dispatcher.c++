// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "http-dispatcher.h"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <capnp/schema.h>
#include <kj/debug.h>

namespace queuesim::server {

namespace {

rpc::EventOutcome outcomeFromName(kj::StringPtr name) {
  if (name.size() == 0) {
    return rpc::EventOutcome::OK;
  }
  KJ_IF_SOME(enumerant, capnp::Schema::from<rpc::EventOutcome>().findEnumerantByName(name)) {
    return static_cast<rpc::EventOutcome>(enumerant.getOrdinal());
  }
  return rpc::EventOutcome::UNKNOWN;
}

}  // namespace

kj::String encodeDispatchRequest(
    kj::StringPtr queueName, kj::ArrayPtr<const SerializedMessage> messages) {
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<rpc::QueueDispatchRequest>();
  request.setQueue(queueName);
  auto list = request.initMessages(messages.size());
  for (auto i: kj::indices(messages)) {
    messages[i].copyTo(list[i]);
  }

  capnp::JsonCodec codec;
  return codec.encode(request.asReader());
}

QueueResponse decodeQueueResponse(kj::StringPtr json) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<rpc::QueueResponse>();
  capnp::JsonCodec codec;
  codec.decode(json, root);

  auto reader = root.asReader();
  return QueueResponse{
    .outcome = outcomeFromName(reader.getOutcome()),
    .retryAll = reader.getRetryAll(),
    .ackAll = reader.getAckAll(),
    .explicitRetries = KJ_MAP(id, reader.getExplicitRetries()) { return kj::str(id); },
    .explicitAcks = KJ_MAP(id, reader.getExplicitAcks()) { return kj::str(id); },
  };
}

HttpQueueDispatcher::HttpQueueDispatcher(
    kj::Own<kj::HttpClient> client, const kj::HttpHeaderTable& headerTable, kj::String url)
    : client(kj::mv(client)),
      headerTable(headerTable),
      url(kj::mv(url)) {}

kj::Promise<QueueResponse> HttpQueueDispatcher::dispatch(
    kj::StringPtr queueName, kj::Array<SerializedMessage> messages) {
  auto body = encodeDispatchRequest(queueName, messages);

  kj::HttpHeaders headers(headerTable);
  headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json");

  auto req = client->request(kj::HttpMethod::POST, url, headers, uint64_t(body.size()));
  {
    auto requestBody = kj::mv(req.body);
    co_await requestBody->write(body.asBytes());
  }

  auto response = co_await req.response;
  auto text = co_await response.body->readAllText();

  KJ_REQUIRE(response.statusCode == 200, "consumer service returned an error", url,
      response.statusCode, response.statusText, text);

  co_return decodeQueueResponse(text);
}

}  // namespace queuesim::server
