#include <gtest/gtest.h>

#include "MediaFetcher.hpp"
#include "test_support.hpp"
#include <fstream>
#include <iterator>

using namespace archiver;
using namespace archiver::test;

TEST(MediaFetcher, WritesIntoBucketWithExtensionFromContentType) {
  TempDir dir;
  FakeTransport transport([](const RecordedCall &) {
    return HttpResponse{200, "JPEGDATA", "image/jpeg; charset=binary"};
  });
  MediaFetcher fetcher(transport, dir.str("media"));

  auto path = fetcher.fetch("https://cdn/x", "ex_social_n1", "f1");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, (dir.path() / "media" / "ex_social_n1" / "f1.jpg").string());
  std::ifstream in(*path, std::ios::binary);
  std::string bytes((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
  EXPECT_EQ(bytes, "JPEGDATA");
}

TEST(MediaFetcher, FailuresYieldNothing) {
  TempDir dir;
  FakeTransport transport;
  MediaFetcher fetcher(transport, dir.str("media"));

  transport.setHandler([](const RecordedCall &) -> HttpResponse {
    throw TransportError("timed out");
  });
  EXPECT_FALSE(fetcher.fetch("https://cdn/x", "b", "a").has_value());

  transport.setHandler(
      [](const RecordedCall &) { return HttpResponse{404, "", "text/plain"}; });
  EXPECT_FALSE(fetcher.fetch("https://cdn/x", "b", "a").has_value());
}

TEST(MediaFetcher, ExtensionTable) {
  EXPECT_EQ(MediaFetcher::extensionForContentType("image/png"), ".png");
  EXPECT_EQ(MediaFetcher::extensionForContentType("IMAGE/JPEG"), ".jpg");
  EXPECT_EQ(MediaFetcher::extensionForContentType("video/mp4"), ".mp4");
  EXPECT_EQ(MediaFetcher::extensionForContentType("application/x-unknown"),
            ".bin");
}

TEST(MediaFetcher, BucketNamesAreFilesystemSafe) {
  EXPECT_EQ(MediaFetcher::sanitizeBucket("ex.social/9abc"), "ex_social_9abc");
  EXPECT_EQ(MediaFetcher::sanitizeBucket("host:8443/a-b_c"), "host_8443_a-b_c");
}
