#include <gtest/gtest.h>

#include "RemoteClient.hpp"
#include "test_support.hpp"

using namespace archiver;
using namespace archiver::test;
using json = nlohmann::json;

namespace {

const std::string kInstance = "https://ex.social";

} // namespace

TEST(RemoteClient, RetriesServerErrorsWithGrowingDelay) {
  int attempt = 0;
  FakeTransport transport([&attempt](const RecordedCall &) {
    ++attempt;
    if (attempt < 3)
      return HttpResponse{500, R"({"error":{"code":"INTERNAL_ERROR"}})",
                          "application/json"};
    return jsonResponse(json{{"id", "n1"}});
  });
  RecordingSleeper sleeper;
  RemoteClient client(transport, RetryPolicy{}, sleeper.sleeper());

  json note = client.fetchNote(kInstance, "n1");
  EXPECT_EQ(note["id"], "n1");
  EXPECT_EQ(transport.calls().size(), 3u);
  ASSERT_EQ(sleeper.delays->size(), 2u);
  EXPECT_EQ((*sleeper.delays)[0], std::chrono::milliseconds(2000));
  EXPECT_EQ((*sleeper.delays)[1], std::chrono::milliseconds(4000));
}

TEST(RemoteClient, ClientErrorFailsImmediately) {
  FakeTransport transport([](const RecordedCall &) {
    return HttpResponse{403, "forbidden", "text/plain"};
  });
  RecordingSleeper sleeper;
  RemoteClient client(transport, RetryPolicy{}, sleeper.sleeper());

  try {
    client.fetchNote(kInstance, "n1");
    FAIL() << "expected RemoteError";
  } catch (const RemoteError &e) {
    ASSERT_TRUE(e.status().has_value());
    EXPECT_EQ(*e.status(), 403);
    EXPECT_FALSE(e.isOverload());
  }
  EXPECT_EQ(transport.calls().size(), 1u);
  EXPECT_TRUE(sleeper.delays->empty());
}

TEST(RemoteClient, TransportErrorsAreRetriedThenReported) {
  FakeTransport transport([](const RecordedCall &) -> HttpResponse {
    throw TransportError("timed out");
  });
  RecordingSleeper sleeper;
  RemoteClient client(transport, RetryPolicy{}, sleeper.sleeper());

  try {
    client.lookupUser(kInstance, "alice");
    FAIL() << "expected RemoteError";
  } catch (const RemoteError &e) {
    EXPECT_FALSE(e.status().has_value());
    EXPECT_NE(std::string(e.what()).find("after 3 attempts"), std::string::npos);
  }
  EXPECT_EQ(transport.calls().size(), 3u);
  EXPECT_EQ(sleeper.delays->size(), 2u);
}

TEST(RemoteClient, ExhaustedServerErrorsStayOverload) {
  FakeTransport transport([](const RecordedCall &) {
    return HttpResponse{500, "boom", "text/plain"};
  });
  RemoteClient client(transport, RetryPolicy{}, RecordingSleeper{}.sleeper());

  try {
    client.fetchNote(kInstance, "n1");
    FAIL() << "expected RemoteError";
  } catch (const RemoteError &e) {
    EXPECT_TRUE(e.isOverload());
  }
}

TEST(RemoteClient, UserNotesPayloadIsClampedAndCursored) {
  FakeTransport transport(
      [](const RecordedCall &) { return jsonResponse(json::array()); });
  RemoteClient client(transport, RetryPolicy{}, RecordingSleeper{}.sleeper());

  client.fetchUserNotes(kInstance, "u1", 50, std::string("cursor"));
  client.fetchUserNotes(kInstance, "u1", 5, std::nullopt);

  auto calls = transport.callsTo("/api/users/notes");
  ASSERT_EQ(calls.size(), 2u);
  json first = json::parse(calls[0].body);
  EXPECT_EQ(first["userId"], "u1");
  EXPECT_EQ(first["limit"], 20);
  EXPECT_EQ(first["includeReplies"], false);
  EXPECT_EQ(first["withRenotes"], false);
  EXPECT_EQ(first["untilId"], "cursor");

  json second = json::parse(calls[1].body);
  EXPECT_EQ(second["limit"], 5);
  EXPECT_FALSE(second.contains("untilId"));
}

TEST(RemoteClient, LookupUserRequiresAnId) {
  FakeTransport transport(
      [](const RecordedCall &) { return jsonResponse(json{{"name", "x"}}); });
  RemoteClient client(transport, RetryPolicy{}, RecordingSleeper{}.sleeper());
  EXPECT_THROW(client.lookupUser(kInstance, "alice"), RemoteError);
}

TEST(RemoteClient, EndpointUrlIsBuiltFromInstance) {
  FakeTransport transport(
      [](const RecordedCall &) { return jsonResponse(json{{"id", "u"}}); });
  RemoteClient client(transport, RetryPolicy{}, RecordingSleeper{}.sleeper());
  client.lookupUser("https://ex.social/", "alice");
  ASSERT_EQ(transport.calls().size(), 1u);
  EXPECT_EQ(transport.calls()[0].url, "https://ex.social/api/users/show");
  EXPECT_EQ(json::parse(transport.calls()[0].body)["username"], "alice");
}
