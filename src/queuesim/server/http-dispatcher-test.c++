// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "http-dispatcher.h"

#include <queuesim/queue/test-fixture.h>

#include <kj/test.h>

namespace queuesim::server {
namespace {

// Stands in for a consumer service: records each request and answers with `reply`.
class FakeConsumerService final: public kj::HttpService {
 public:
  explicit FakeConsumerService(kj::HttpHeaderTable& headerTable): headerTable(headerTable) {}

  struct Request {
    kj::HttpMethod method;
    kj::String url;
    kj::String contentType;
    kj::String body;
  };
  kj::Vector<Request> requests;

  uint status = 200;
  kj::String reply = kj::str(R"({"outcome":"ok"})");

  kj::Promise<void> request(kj::HttpMethod method,
      kj::StringPtr url,
      const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody,
      Response& response) override {
    auto contentType = kj::str(headers.get(kj::HttpHeaderId::CONTENT_TYPE).orDefault(""));
    auto body = co_await requestBody.readAllText();
    requests.add(Request{method, kj::str(url), kj::mv(contentType), kj::mv(body)});

    kj::HttpHeaders responseHeaders(headerTable);
    auto stream = response.send(status, status == 200 ? "OK"_kj : "Internal Server Error"_kj,
        responseHeaders, uint64_t(reply.size()));
    co_await stream->write(reply.asBytes());
  }

 private:
  kj::HttpHeaderTable& headerTable;
};

struct DispatchFixture {
  kj::EventLoop loop;
  kj::WaitScope waitScope{loop};
  kj::HttpHeaderTable table;
  FakeConsumerService service{table};

  kj::Own<HttpQueueDispatcher> newDispatcher() {
    return kj::refcounted<HttpQueueDispatcher>(
        kj::newHttpClient(table, service), table, kj::str("http://consumer.local/queue"));
  }
};

kj::Array<SerializedMessage> twoMessages() {
  auto builder = kj::heapArrayBuilder<SerializedMessage>(2);
  builder.add(SerializedMessage{
    .id = kj::str("a"),
    .timestamp = kj::UNIX_EPOCH + 1000 * kj::MILLISECONDS,
    .contentType = ContentType::TEXT,
    .body = kj::str("aGk="),
  });
  builder.add(SerializedMessage{
    .id = kj::str("b"),
    .timestamp = kj::UNIX_EPOCH + 2000 * kj::MILLISECONDS,
    .contentType = ContentType::OPAQUE,
    .body = kj::str("AAE="),
  });
  return builder.finish();
}

KJ_TEST("dispatch POSTs the batch as JSON") {
  DispatchFixture f;
  auto dispatcher = f.newDispatcher();

  auto response = dispatcher->dispatch("jobs", twoMessages()).wait(f.waitScope);
  KJ_EXPECT(response.outcome == rpc::EventOutcome::OK);
  KJ_EXPECT(!response.retryAll);
  KJ_EXPECT(!response.ackAll);

  KJ_ASSERT(f.service.requests.size() == 1);
  auto& request = f.service.requests[0];
  KJ_EXPECT(request.method == kj::HttpMethod::POST);
  KJ_EXPECT(request.url == "http://consumer.local/queue", request.url);
  KJ_EXPECT(request.contentType == "application/json");
  KJ_EXPECT(request.body ==
          R"({"queue":"jobs","messages":[)"
          R"({"id":"a","timestamp":1000,"contentType":"text","body":"aGk="},)"
          R"({"id":"b","timestamp":2000,"contentType":"opaque","body":"AAE="}]})",
      request.body);
}

KJ_TEST("consumer responses are decoded") {
  auto response = decodeQueueResponse(
      R"({"outcome":"ok","ackAll":true,"explicitRetries":["b"],"explicitAcks":["a","c"]})");
  KJ_EXPECT(response.outcome == rpc::EventOutcome::OK);
  KJ_EXPECT(response.ackAll);
  KJ_EXPECT(kj::strArray(response.explicitRetries, ",") == "b");
  KJ_EXPECT(kj::strArray(response.explicitAcks, ",") == "a,c");

  KJ_EXPECT(decodeQueueResponse(R"({"outcome":"exceededCpu"})").outcome ==
      rpc::EventOutcome::EXCEEDED_CPU);
  KJ_EXPECT(decodeQueueResponse(R"({"outcome":"melted"})").outcome ==
      rpc::EventOutcome::UNKNOWN);
  KJ_EXPECT(decodeQueueResponse(R"({"retryAll":true})").outcome == rpc::EventOutcome::OK);
  KJ_EXPECT(decodeQueueResponse("{}").explicitRetries.size() == 0);

  KJ_EXPECT_THROW(FAILED, decodeQueueResponse("not json"));
}

KJ_TEST("a failing consumer service rejects the dispatch") {
  DispatchFixture f;
  auto dispatcher = f.newDispatcher();
  f.service.status = 500;
  f.service.reply = kj::str("boom");

  KJ_EXPECT_THROW_MESSAGE("consumer service returned an error",
      dispatcher->dispatch("jobs", twoMessages()).wait(f.waitScope));
}

KJ_TEST("broker delivers to a consumer service") {
  kj::HttpHeaderTable table;
  FakeConsumerService service(table);
  test::QueueFixture f;
  service.reply = kj::str(R"({"outcome":"ok","explicitAcks":["000102030405060708090a0b0c0d0e0f"]})");

  f.broker.setConsumer("jobs",
      Consumer{
        .maxBatchSize = 1,
        .dispatcher = kj::refcounted<HttpQueueDispatcher>(
            kj::newHttpClient(table, service), table, kj::str("http://consumer.local/")),
      });
  f.send("jobs", "hello");
  f.poll();

  KJ_ASSERT(service.requests.size() == 1);
  KJ_EXPECT(service.requests[0].body.contains(R"("id":"000102030405060708090a0b0c0d0e0f")"),
      service.requests[0].body);
  KJ_EXPECT(service.requests[0].body.contains(R"("body":"aGVsbG8=")"), service.requests[0].body);
  KJ_EXPECT(f.queue("jobs").getPending().size() == 0);
}

}  // namespace
}  // namespace queuesim::server
