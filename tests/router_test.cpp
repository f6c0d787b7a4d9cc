#include <rawhttp/router.hpp>
#include <rawhttp/response.hpp>

#include <gtest/gtest.h>

using namespace rawhttp;

namespace {
    Handler noop() {
        return [](const HTTP_Request &, HTTP_Response &) {};
    }
}

TEST(RouterTest, StaticPatternIsExactMatch) {
    Router router;
    router.add_route("GET", "/user-agent", noop());

    auto match = router.match("GET", "/user-agent");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->path_pattern, "/user-agent");
    EXPECT_TRUE(match->params.empty());

    EXPECT_FALSE(router.match("GET", "/user-agent/").has_value());
    EXPECT_FALSE(router.match("GET", "/user-agents").has_value());
    EXPECT_FALSE(router.match("GET", "/User-Agent").has_value());
}

TEST(RouterTest, RootOnlyMatchesRoot) {
    Router router;
    router.add_route("GET", "/", noop());
    EXPECT_TRUE(router.match("GET", "/").has_value());
    EXPECT_FALSE(router.match("GET", "").has_value());
    EXPECT_FALSE(router.match("GET", "/echo").has_value());
}

TEST(RouterTest, CapturesParameterSegments) {
    Router router;
    router.add_route("GET", "/files/:filename", noop());

    auto match = router.match("GET", "/files/new.txt");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->path_pattern, "/files/:filename");
    EXPECT_EQ(match->params.at("filename"), "new.txt");
}

TEST(RouterTest, CapturesSeveralParametersInOrder) {
    Router router;
    router.add_route("GET", "/users/:id/posts/:post-id", noop());

    auto match = router.match("GET", "/users/42/posts/abc-def_1");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->params.size(), 2u);
    EXPECT_EQ(match->params.at("id"), "42");
    EXPECT_EQ(match->params.at("post-id"), "abc-def_1");
}

TEST(RouterTest, ParameterNeverSpansSlash) {
    Router router;
    router.add_route("GET", "/echo/:str", noop());

    EXPECT_FALSE(router.match("GET", "/echo/a/b").has_value());
    EXPECT_FALSE(router.match("GET", "/echo/").has_value());
    EXPECT_FALSE(router.match("GET", "/echo").has_value());
}

TEST(RouterTest, ParameterRejectsCharactersOutsideTheSet) {
    Router router;
    router.add_route("GET", "/echo/:str", noop());

    EXPECT_FALSE(router.match("GET", "/echo/a b").has_value());
    EXPECT_FALSE(router.match("GET", "/echo/a%20b").has_value());
    EXPECT_FALSE(router.match("GET", "/echo/..").has_value());
    EXPECT_FALSE(router.match("GET", "/echo/.").has_value());
    EXPECT_TRUE(router.match("GET", "/echo/..hidden").has_value());
}

TEST(RouterTest, FirstRegisteredPatternWins) {
    Router router;
    router.add_route("GET", "/items/:a", noop());
    router.add_route("GET", "/items/:b", noop());
    router.add_route("GET", "/items/special", noop());

    auto match = router.match("GET", "/items/special");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->path_pattern, "/items/:a");
    EXPECT_EQ(match->params.at("a"), "special");
}

TEST(RouterTest, RoutesAreScopedByMethod) {
    Router router;
    router.add_route("POST", "/files/:filename", noop());

    EXPECT_FALSE(router.match("GET", "/files/x").has_value());
    EXPECT_TRUE(router.match("POST", "/files/x").has_value());
    EXPECT_TRUE(router.has_method("POST"));
    EXPECT_FALSE(router.has_method("GET"));
    EXPECT_FALSE(router.has_method("DELETE"));
}

TEST(RouterTest, FindLooksUpPatternStrings) {
    Router router;
    router.add_route("GET", "/echo/:str", noop());

    EXPECT_NE(router.find("GET", "/echo/:str"), nullptr);
    EXPECT_EQ(router.find("GET", "/echo/hello"), nullptr);
    EXPECT_EQ(router.find("POST", "/echo/:str"), nullptr);
}

TEST(RouterTest, MatchedHandlerIsTheRegisteredOne) {
    Router router;
    int called = 0;
    router.add_route("GET", "/a", [&called](const HTTP_Request &, HTTP_Response &) { called = 1; });
    router.add_route("GET", "/b", [&called](const HTTP_Request &, HTTP_Response &) { called = 2; });

    auto match = router.match("GET", "/b");
    ASSERT_TRUE(match.has_value());
    StringSink sink;
    HTTP_Response response(sink);
    (*match->handler)(HTTP_Request{}, response);
    EXPECT_EQ(called, 2);
}

TEST(RouterTest, CompilePathPatternMarksParameters) {
    auto segments = Router::compile_path_pattern("/files/:name/:");
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_FALSE(segments[0].is_param);
    EXPECT_EQ(segments[1].text, "files");
    EXPECT_FALSE(segments[1].is_param);
    EXPECT_TRUE(segments[2].is_param);
    EXPECT_EQ(segments[2].text, "name");
    EXPECT_FALSE(segments[3].is_param);
    EXPECT_EQ(segments[3].text, ":");
}
