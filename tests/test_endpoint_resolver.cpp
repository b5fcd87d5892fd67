#include "test_support.hpp"

#include <sensestream/endpoint_resolver.hpp>

using sensestream::EndpointResolver;
using sensestream::HttpResponse;
using sensestream::ResolutionError;
using sensestream::normalize_host;
using sensestream::parse_hostname_response;
namespace t = sensestream::test;

namespace {

class StaticBearer : public sensestream::BearerSource {
public:
  std::string bearer_token() override {
    ++calls;
    return "tok";
  }
  std::string token_type() const override { return "KEYPAIR_JWT"; }
  int calls = 0;
};

HttpResponse response(int status, std::string body, std::string content_type) {
  HttpResponse r;
  r.status = status;
  r.body = std::move(body);
  r.content_type = std::move(content_type);
  return r;
}

} // namespace

TEST(NormalizeHost, UnderscoresBecomeDashes) {
  EXPECT_EQ(normalize_host("xy12345_ingest_eu.snowflakecomputing.com"),
            "xy12345-ingest-eu.snowflakecomputing.com");
  EXPECT_EQ(normalize_host("  ingest.example.com\n"), "ingest.example.com");
}

TEST(ParseHostnameResponse, PlainText) {
  EXPECT_EQ(parse_hostname_response(
                response(200, "xy12345_ingest.snowflakecomputing.com\n", "text/plain")),
            "xy12345-ingest.snowflakecomputing.com");
}

TEST(ParseHostnameResponse, Json) {
  EXPECT_EQ(parse_hostname_response(
                response(200, R"({"hostname":"a_b.example.com"})", "application/json")),
            "a-b.example.com");
  EXPECT_EQ(parse_hostname_response(
                response(200, R"({"ingest_host":"c.example.com"})", "")),
            "c.example.com");
}

TEST(ParseHostnameResponse, Rejects) {
  EXPECT_THROW(parse_hostname_response(response(200, "", "text/plain")), ResolutionError);
  EXPECT_THROW(parse_hostname_response(response(200, "   \n", "text/plain")),
               ResolutionError);
  EXPECT_THROW(parse_hostname_response(response(200, "{}", "application/json")),
               ResolutionError);
  EXPECT_THROW(parse_hostname_response(response(200, "{oops", "application/json")),
               ResolutionError);
}

TEST(EndpointResolver, ResolvesOnceAndCaches) {
  t::FakeTransport http;
  http.reply("GET", "/v2/streaming/hostname", 200, "xy12345_ingest.snowflakecomputing.com",
             "text/plain");
  StaticBearer auth;
  EndpointResolver resolver(http, "https://xy12345.snowflakecomputing.com", auth);

  EXPECT_FALSE(resolver.resolved());
  EXPECT_EQ(resolver.resolve_ingest_host(), "xy12345-ingest.snowflakecomputing.com");
  EXPECT_EQ(resolver.resolve_ingest_host(), "xy12345-ingest.snowflakecomputing.com");
  EXPECT_TRUE(resolver.resolved());
  EXPECT_EQ(http.requests.size(), 1u);
  EXPECT_EQ(auth.calls, 1);

  const auto &req = http.requests.front();
  EXPECT_EQ(req.method, "GET");
  EXPECT_EQ(t::header(req, "Authorization"), "Bearer tok");
  EXPECT_EQ(t::header(req, "X-Snowflake-Authorization-Token-Type"), "KEYPAIR_JWT");
}

TEST(EndpointResolver, ErrorStatus) {
  t::FakeTransport http;
  http.reply("GET", "/v2/streaming/hostname", 503, "unavailable", "text/plain");
  StaticBearer auth;
  EndpointResolver resolver(http, "https://xy12345.snowflakecomputing.com", auth);

  EXPECT_THROW(resolver.resolve_ingest_host(), ResolutionError);
  EXPECT_FALSE(resolver.resolved());

  // следующая попытка снова идёт в сеть
  http.reply("GET", "/v2/streaming/hostname", 200, "ingest.example.com", "text/plain");
  EXPECT_EQ(resolver.resolve_ingest_host(), "ingest.example.com");
}

TEST(EndpointResolver, TransportFailure) {
  t::FakeTransport http;
  http.fail("GET", "/v2/streaming/hostname");
  StaticBearer auth;
  EndpointResolver resolver(http, "https://xy12345.snowflakecomputing.com", auth);
  EXPECT_THROW(resolver.resolve_ingest_host(), ResolutionError);
}
