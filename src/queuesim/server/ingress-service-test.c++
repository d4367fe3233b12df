// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "ingress-service.h"

#include <queuesim/queue/limits.h>
#include <queuesim/queue/test-fixture.h>

#include <kj/test.h>

namespace queuesim::server {
namespace {

struct Reply {
  uint status;
  kj::String body;
};

struct IngressFixture: public test::QueueFixture {
  kj::HttpHeaderTable::Builder tableBuilder;
  IngressService service{broker, tableBuilder};
  kj::Own<kj::HttpHeaderTable> table = tableBuilder.build();
  kj::Own<kj::HttpClient> client = kj::newHttpClient(*table, service);

  kj::HttpHeaders headers() {
    return kj::HttpHeaders(*table);
  }

  Reply post(kj::StringPtr url, kj::StringPtr body, const kj::HttpHeaders& headers) {
    auto req = client->request(kj::HttpMethod::POST, url, headers, uint64_t(body.size()));
    {
      auto stream = kj::mv(req.body);
      stream->write(body.asBytes()).wait(waitScope);
    }
    return finish(kj::mv(req.response));
  }

  Reply post(kj::StringPtr url, kj::StringPtr body) {
    return post(url, body, headers());
  }

  // Sends only the request head, for requests refused before their body is read.
  Reply postHeadOnly(kj::StringPtr url, uint64_t declaredSize, const kj::HttpHeaders& headers) {
    auto req = client->request(kj::HttpMethod::POST, url, headers, declaredSize);
    return finish(kj::mv(req.response));
  }

  Reply get(kj::StringPtr url) {
    auto req = client->request(kj::HttpMethod::GET, url, headers());
    return finish(kj::mv(req.response));
  }

  Reply finish(kj::Promise<kj::HttpClient::Response> promise) {
    auto response = promise.wait(waitScope);
    auto body = response.body->readAllText().wait(waitScope);
    return Reply{response.statusCode, kj::mv(body)};
  }
};

KJ_TEST("POST /<queue>/message buffers one message") {
  IngressFixture f;
  f.attach("jobs");

  auto headers = f.headers();
  headers.addPtrPtr("X-Msg-Fmt", "text");
  auto reply = f.post("/jobs/message", "hello", headers);
  KJ_EXPECT(reply.status == 200, reply.body);
  KJ_EXPECT(reply.body == "");

  KJ_EXPECT(f.post("/jobs/message", "\x01\x02").status == 200);

  auto pending = f.queue("jobs").getPending();
  KJ_ASSERT(pending.size() == 2);
  KJ_EXPECT(pending[0].getContentType() == ContentType::TEXT);
  KJ_EXPECT(pending[0].getBody().get<TextBody>().text == "hello");
  KJ_EXPECT(pending[1].getContentType() == ContentType::OPAQUE);
}

KJ_TEST("queue names in the path are percent-decoded") {
  IngressFixture f;
  f.attach("my queue");

  KJ_EXPECT(f.post("/my%20queue/message", "hi").status == 200);
  KJ_EXPECT(f.queue("my queue").getPending().size() == 1);
}

KJ_TEST("messages for a queue without a consumer are accepted and dropped") {
  IngressFixture f;
  KJ_EXPECT(f.post("/nobody/message", "hi").status == 200);
  KJ_EXPECT(f.queue("nobody").getPending().size() == 0);
}

KJ_TEST("message validation errors become responses") {
  IngressFixture f;
  f.attach("jobs");

  auto xml = f.headers();
  xml.addPtrPtr("X-Msg-Fmt", "xml");
  auto reply = f.post("/jobs/message", "<a/>", xml);
  KJ_EXPECT(reply.status == 400);
  KJ_EXPECT(reply.body.startsWith("message content type xml is invalid"), reply.body);

  auto json = f.headers();
  json.addPtrPtr("X-Msg-Fmt", "json");
  reply = f.post("/jobs/message", "{oops", json);
  KJ_EXPECT(reply.status == 400);
  KJ_EXPECT(reply.body.startsWith("message body is not valid JSON"), reply.body);

  reply = f.postHeadOnly("/jobs/message", MAX_MESSAGE_SIZE_BYTES + 1, f.headers());
  KJ_EXPECT(reply.status == 413);
  KJ_EXPECT(reply.body == "message length of 128001 bytes exceeds limit of 128000", reply.body);

  KJ_EXPECT(f.queue("jobs").getPending().size() == 0);
}

KJ_TEST("POST /<queue>/batch buffers every message") {
  IngressFixture f;
  f.attach("jobs");

  auto headers = f.headers();
  headers.addPtrPtr("CF-Queue-Batch-Count", "2");
  headers.addPtrPtr("CF-Queue-Batch-Bytes", "9");
  headers.addPtrPtr("CF-Queue-Largest-Msg", "7");
  auto reply = f.post("/jobs/batch",
      R"({"messages":[{"body":"aGk=","contentType":"text"},)"
      R"({"body":"eyJhIjoxfQ==","contentType":"json","delaySecs":0}]})",
      headers);
  KJ_EXPECT(reply.status == 200, reply.body);

  auto pending = f.queue("jobs").getPending();
  KJ_ASSERT(pending.size() == 2);
  KJ_EXPECT(pending[0].getBody().get<TextBody>().text == "hi");
  KJ_EXPECT(pending[1].getContentType() == ContentType::JSON);
  KJ_EXPECT(pending[1].getBody().get<JsonBody>().getValue().isObject());
}

KJ_TEST("declared batch shape is checked before the body is read") {
  IngressFixture f;
  f.attach("jobs");

  auto count = f.headers();
  count.addPtrPtr("CF-Queue-Batch-Count", "101");
  auto reply = f.postHeadOnly("/jobs/batch", 16, count);
  KJ_EXPECT(reply.status == 413);
  KJ_EXPECT(reply.body == "batch message count of 101 exceeds limit of 100", reply.body);

  auto bytes = f.headers();
  bytes.addPtrPtr("CF-Queue-Batch-Bytes", "288001");
  reply = f.postHeadOnly("/jobs/batch", 16, bytes);
  KJ_EXPECT(reply.status == 413);
  KJ_EXPECT(reply.body == "batch size of 288001 bytes exceeds limit of 288000", reply.body);

  auto garbage = f.headers();
  garbage.addPtrPtr("CF-Queue-Largest-Msg", "lots");
  reply = f.postHeadOnly("/jobs/batch", 16, garbage);
  KJ_EXPECT(reply.status == 400);
  KJ_EXPECT(reply.body.startsWith("invalid CF-Queue-Largest-Msg header"), reply.body);
}

KJ_TEST("malformed batches are rejected whole") {
  IngressFixture f;
  f.attach("jobs");

  auto reply = f.post("/jobs/batch", R"({"messages":[)");
  KJ_EXPECT(reply.status == 400);
  KJ_EXPECT(reply.body.startsWith("batch request is not valid JSON"), reply.body);

  reply = f.post("/jobs/batch",
      R"({"messages":[{"body":"aGk=","contentType":"text"},{"body":"%%%","contentType":"bytes"}]})");
  KJ_EXPECT(reply.status == 400);
  KJ_EXPECT(reply.body == "message body is not valid base64", reply.body);

  reply = f.post("/jobs/batch", R"({"messages":[{"body":"AA==","timestamp":1e16}]})");
  KJ_EXPECT(reply.status == 400);
  KJ_EXPECT(reply.body.contains("out of range"), reply.body);

  reply = f.post("/jobs/batch", R"({"messages":[]})");
  KJ_EXPECT(reply.status == 400);

  KJ_EXPECT(f.queue("jobs").getPending().size() == 0);
}

KJ_TEST("unknown routes and methods") {
  IngressFixture f;

  KJ_EXPECT(f.post("/jobs/other", "").status == 404);
  KJ_EXPECT(f.post("/jobs", "").status == 404);
  KJ_EXPECT(f.post("/a/b/message", "").status == 404);
  KJ_EXPECT(f.get("/jobs/message").status == 405);
}

KJ_TEST("a disposed broker refuses messages") {
  IngressFixture f;
  f.attach("jobs");
  f.broker.dispose();

  auto reply = f.post("/jobs/message", "late");
  KJ_EXPECT(reply.status == 503);
  KJ_EXPECT(reply.body == "queue broker has been disposed", reply.body);
}

}  // namespace
}  // namespace queuesim::server
