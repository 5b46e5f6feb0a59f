/**
 * @file test_router.cpp
 * @brief Exact method + path dispatch with query and trailing slash ignored.
 */

#include <gtest/gtest.h>

#include "contactform/server/Router.hpp"

using contactform::server::RequestContext;
using contactform::server::Router;

TEST(Router, ResolvesExactPath) {
  Router router;
  int calls = 0;
  router.addRoute("POST", "/submit", [&calls](RequestContext&) { ++calls; });

  auto handler = router.resolve("POST", "/submit");
  ASSERT_TRUE(static_cast<bool>(handler));
  RequestContext ctx;
  handler(ctx);
  EXPECT_EQ(calls, 1);
}

TEST(Router, MethodIsCaseInsensitive) {
  Router router;
  router.addRoute("post", "/submit", [](RequestContext&) {});

  EXPECT_TRUE(static_cast<bool>(router.resolve("POST", "/submit")));
  EXPECT_TRUE(static_cast<bool>(router.resolve("Post", "/submit")));
}

TEST(Router, TrailingSlashAndQueryIgnored) {
  Router router;
  router.addRoute("POST", "/submit", [](RequestContext&) {});

  EXPECT_TRUE(static_cast<bool>(router.resolve("POST", "/submit/")));
  EXPECT_TRUE(static_cast<bool>(router.resolve("POST", "/submit?utm=1")));
  EXPECT_TRUE(static_cast<bool>(router.resolve("POST", "/submit/?utm=1")));
}

TEST(Router, MethodMismatchAndUnknownPath) {
  Router router;
  router.addRoute("POST", "/submit", [](RequestContext&) {});

  EXPECT_FALSE(static_cast<bool>(router.resolve("PUT", "/submit")));
  EXPECT_FALSE(static_cast<bool>(router.resolve("POST", "/submitted")));
  EXPECT_FALSE(static_cast<bool>(router.resolve("POST", "/submit/extra")));
  EXPECT_FALSE(static_cast<bool>(router.resolve("POST", "/")));
  EXPECT_FALSE(static_cast<bool>(router.resolve("POST", "/SUBMIT")));
}

TEST(Router, RootPathRoutable) {
  Router router;
  router.addRoute("GET", "/", [](RequestContext&) {});

  EXPECT_TRUE(static_cast<bool>(router.resolve("GET", "/")));
  EXPECT_TRUE(static_cast<bool>(router.resolve("GET", "/?x=1")));
}

TEST(Router, LaterRegistrationReplacesEarlier) {
  Router router;
  int which = 0;
  router.addRoute("POST", "/submit", [&which](RequestContext&) { which = 1; });
  router.addRoute("POST", "/submit", [&which](RequestContext&) { which = 2; });

  RequestContext ctx;
  router.resolve("POST", "/submit")(ctx);
  EXPECT_EQ(which, 2);
}
