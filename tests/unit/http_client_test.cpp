#include <shelter/net/header_map.h>
#include <shelter/net/http_client.h>
#include <shelter/net/request.h>
#include <shelter/net/response.h>
#include <gtest/gtest.h>
#include <zlib.h>

#include <string>
#include <vector>

using namespace shelter::net;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> gzip(const std::string& text) {
    z_stream strm{};
    deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(text.size())) + 32);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    strm.avail_in = static_cast<uInt>(text.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    deflate(&strm, Z_FINISH);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

} // namespace

// ===========================================================================
// HeaderMap
// ===========================================================================

TEST(HeaderMapTest, NamesAreCaseInsensitive) {
    HeaderMap headers;
    headers.set("Content-Type", "text/html");
    EXPECT_EQ(headers.get("content-type"), "text/html");
    EXPECT_TRUE(headers.has("CONTENT-TYPE"));
}

TEST(HeaderMapTest, SetReplacesInPlaceAndDropsDuplicates) {
    HeaderMap headers;
    headers.append("Accept", "a");
    headers.append("X-Other", "1");
    headers.append("accept", "b");
    headers.set("Accept", "c");

    ASSERT_EQ(headers.size(), 2u);
    auto it = headers.begin();
    EXPECT_EQ(it->first, "accept");
    EXPECT_EQ(it->second, "c");
    ++it;
    EXPECT_EQ(it->first, "x-other");
}

TEST(HeaderMapTest, AppendKeepsEveryValue) {
    HeaderMap headers;
    headers.append("Set-Cookie", "a=1");
    headers.append("Set-Cookie", "b=2");
    auto all = headers.get_all("set-cookie");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], "a=1");
    EXPECT_EQ(all[1], "b=2");
}

TEST(HeaderMapTest, RemoveDropsAllValues) {
    HeaderMap headers;
    headers.append("X-A", "1");
    headers.append("x-a", "2");
    headers.remove("X-A");
    EXPECT_TRUE(headers.empty());
    EXPECT_FALSE(headers.get("x-a").has_value());
}

// ===========================================================================
// Request
// ===========================================================================

TEST(RequestTest, MethodNamesRoundTrip) {
    EXPECT_EQ(method_to_string(Method::DELETE_METHOD), "DELETE");
    EXPECT_EQ(string_to_method("post"), Method::POST);
    EXPECT_EQ(string_to_method("PATCH"), Method::PATCH);
}

TEST(RequestTest, ParseUrlFillsTarget) {
    Request req;
    req.url = "https://Example.com:8443/api/checkin?x=1#frag";
    ASSERT_TRUE(req.parse_url());
    EXPECT_EQ(req.host, "example.com");
    EXPECT_EQ(req.port, 8443);
    EXPECT_TRUE(req.use_tls);
    EXPECT_EQ(req.path, "/api/checkin");
    EXPECT_EQ(req.query, "x=1");
}

TEST(RequestTest, ParseUrlRejectsOtherSchemes) {
    Request req;
    req.url = "ftp://example.com/file";
    EXPECT_FALSE(req.parse_url());
    req.url = "/relative";
    EXPECT_FALSE(req.parse_url());
}

TEST(RequestTest, SerializeWritesRequestLineAndHost) {
    Request req;
    req.url = "http://127.0.0.1:5000/api/status?full=1";
    ASSERT_TRUE(req.parse_url());
    auto data = req.serialize();
    std::string wire(data.begin(), data.end());

    EXPECT_EQ(wire.rfind("GET /api/status?full=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(wire.find("Host: 127.0.0.1:5000\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Accept-Encoding: gzip, deflate\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("Content-Length"), std::string::npos);
}

TEST(RequestTest, SerializeFramesPostBody) {
    Request req;
    req.url = "http://localhost/api/checkin";
    req.method = Method::POST;
    ASSERT_TRUE(req.parse_url());
    req.set_body(R"({"employee":7})");
    auto data = req.serialize();
    std::string wire(data.begin(), data.end());

    EXPECT_NE(wire.find("Content-Length: 14\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 14), R"({"employee":7})");
}

// ===========================================================================
// Response
// ===========================================================================

TEST(ResponseTest, ParseStatusHeadersAndBody) {
    auto resp = Response::parse(bytes(
        "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\nhello"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 200);
    EXPECT_EQ(resp->status_text, "OK");
    EXPECT_EQ(resp->headers.get("content-type"), "text/plain");
    EXPECT_EQ(resp->body_as_string(), "hello");
    EXPECT_TRUE(resp->ok());
}

TEST(ResponseTest, ContentLengthTruncatesExtraBytes) {
    auto resp = Response::parse(bytes("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabcdef"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body_as_string(), "abc");
}

TEST(ResponseTest, ChunkedBodyIsDechunked) {
    auto resp = Response::parse(bytes(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body_as_string(), "Wikipedia");
    EXPECT_FALSE(resp->headers.has("transfer-encoding"));
}

TEST(ResponseTest, GzipBodyIsDecoded) {
    std::string text = "{\"success\":true,\"present\":12}";
    auto compressed = gzip(text);
    std::string head = "HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " +
                       std::to_string(compressed.size()) + "\r\n\r\n";
    auto raw = bytes(head);
    raw.insert(raw.end(), compressed.begin(), compressed.end());

    auto resp = Response::parse(raw);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body_as_string(), text);
    EXPECT_FALSE(resp->headers.has("content-encoding"));
    EXPECT_EQ(resp->headers.get("content-length"), std::to_string(text.size()));
}

TEST(ResponseTest, MalformedStatusLineIsRejected) {
    EXPECT_FALSE(Response::parse(bytes("HTTP/1.1 abc OK\r\n\r\n")).has_value());
    EXPECT_FALSE(Response::parse(bytes("garbage\r\n\r\n")).has_value());
    EXPECT_FALSE(Response::parse(bytes("HTTP/1.1 200 OK\r\n")).has_value());
}

TEST(ResponseTest, TypeNames) {
    EXPECT_STREQ(response_type_name(ResponseType::Opaque), "opaque");
    EXPECT_EQ(response_type_from_name("cors"), ResponseType::Cors);
    EXPECT_FALSE(response_type_from_name("weird").has_value());
}

// ===========================================================================
// Redirects
// ===========================================================================

TEST(HttpClientTest, ResolveRedirectRelativeToCurrentUrl) {
    Request req;
    req.url = "http://127.0.0.1:5000/api/old/path";
    EXPECT_EQ(resolve_redirect(req, "/login"), "http://127.0.0.1:5000/login");
    EXPECT_EQ(resolve_redirect(req, "new"), "http://127.0.0.1:5000/api/old/new");
    EXPECT_EQ(resolve_redirect(req, "https://other.example/x"), "https://other.example/x");
}

TEST(HttpClientTest, UnparsableUrlIsANetworkFailure) {
    HttpClient client;
    Request req;
    req.url = "not a url";
    EXPECT_FALSE(client.fetch(req).has_value());
}
