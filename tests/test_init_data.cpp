#include <catch2/catch.hpp>

#include "database_fixture.hpp"

#include <lootbank/protocol/init_data.hpp>

#include <cctype>

using namespace lootbank::protocol;
using lootbank::test::make_init_data;
using lootbank::test::sign_fields;
using lootbank::test::url_encode;
using lootbank::test::user_json;

namespace {

   std::string hash_of(const std::string& payload) {
      auto pos = payload.rfind("&hash=");
      REQUIRE(pos != std::string::npos);
      return payload.substr(pos + 6);
   }

   std::string without_hash(const std::string& payload) {
      return payload.substr(0, payload.rfind("&hash="));
   }

}

// ============================================================================
// Payload parsing
// ============================================================================

TEST_CASE("parse_init_data splits segments on the first equals sign", "[init_data][parse]") {
   init_data_fields fields;

   REQUIRE(parse_init_data("b=2&a=x=y&c=", fields));
   REQUIRE(fields.size() == 3);
   REQUIRE(fields[0].first == "b");
   REQUIRE(fields[0].second == "2");
   REQUIRE(fields[1].first == "a");
   REQUIRE(fields[1].second == "x=y");
   REQUIRE(fields[2].first == "c");
   REQUIRE(fields[2].second.empty());
}

TEST_CASE("parse_init_data rejects malformed payloads", "[init_data][parse]") {
   init_data_fields fields;

   REQUIRE_FALSE(parse_init_data("", fields));
   REQUIRE_FALSE(parse_init_data("novalue", fields));
   REQUIRE_FALSE(parse_init_data("=value", fields));
   REQUIRE_FALSE(parse_init_data("a=1&&b=2", fields));
   REQUIRE_FALSE(parse_init_data("a=1&", fields));
   REQUIRE_FALSE(parse_init_data("a=1&a=2", fields));
}

TEST_CASE("build_check_string sorts by key and joins with newlines", "[init_data][parse]") {
   init_data_fields fields;
   fields.emplace_back("user", "%7B%7D");
   fields.emplace_back("auth_date", "1700000000");
   fields.emplace_back("query_id", "Q");

   REQUIRE(build_check_string(fields) == "auth_date=1700000000\nquery_id=Q\nuser=%7B%7D");
   REQUIRE(build_check_string(init_data_fields()).empty());
}

TEST_CASE("url_decode handles escapes and plus signs", "[init_data][parse]") {
   std::string out;

   REQUIRE(url_decode("%7B%22id%22%3A1%7D", out));
   REQUIRE(out == "{\"id\":1}");

   REQUIRE(url_decode("a+b%20c", out));
   REQUIRE(out == "a b c");

   REQUIRE_FALSE(url_decode("%7", out));
   REQUIRE_FALSE(url_decode("%zz", out));
}

// ============================================================================
// Verification
// ============================================================================

TEST_CASE("A correctly signed payload verifies", "[init_data][verify]") {
   init_data_verifier verifier(LOOTBANK_TEST_BOT_TOKEN);

   REQUIRE(verifier.verify(make_init_data(1001)));
   REQUIRE(verifier.verify(make_init_data(2002, "someone_else")));
}

TEST_CASE("Field order in the payload does not matter", "[init_data][verify]") {
   init_data_verifier verifier(LOOTBANK_TEST_BOT_TOKEN);

   init_data_fields fields;
   fields.emplace_back("user", url_encode(user_json(1001, "tester")));
   fields.emplace_back("auth_date", "1700000000");
   fields.emplace_back("query_id", "AAH");

   std::string hash = hash_of(sign_fields(fields));
   std::string reordered = "query_id=AAH&hash=" + hash + "&auth_date=1700000000&user=" +
                           url_encode(user_json(1001, "tester"));

   REQUIRE(verifier.verify(reordered));
}

TEST_CASE("Changing any single character of the hash fails verification", "[init_data][verify]") {
   init_data_verifier verifier(LOOTBANK_TEST_BOT_TOKEN);
   const std::string payload = make_init_data(1001);
   const std::string body = without_hash(payload);
   const std::string hash = hash_of(payload);

   REQUIRE(hash.size() == 64);

   for (size_t i = 0; i < hash.size(); ++i) {
      std::string forged = hash;
      forged[i] = (forged[i] == '0') ? '1' : '0';
      REQUIRE_FALSE(verifier.verify(body + "&hash=" + forged));
   }
}

TEST_CASE("Changing a value fails verification", "[init_data][verify]") {
   init_data_verifier verifier(LOOTBANK_TEST_BOT_TOKEN);
   std::string payload = make_init_data(1001);

   auto pos = payload.find("auth_date=1700000000");
   REQUIRE(pos != std::string::npos);

   std::string tampered = payload;
   tampered[pos + std::string("auth_date=170000000").size()] = '1';
   REQUIRE_FALSE(verifier.verify(tampered));

   std::string other_user = payload;
   auto user_pos = other_user.find("1001");
   REQUIRE(user_pos != std::string::npos);
   other_user[user_pos + 3] = '2';
   REQUIRE_FALSE(verifier.verify(other_user));
}

TEST_CASE("Payloads signed with another bot token fail verification", "[init_data][verify]") {
   init_data_verifier verifier("999999:another-token");

   REQUIRE_FALSE(verifier.verify(make_init_data(1001)));
}

TEST_CASE("A payload without hash is rejected without throwing", "[init_data][verify]") {
   init_data_verifier verifier(LOOTBANK_TEST_BOT_TOKEN);
   const std::string body = without_hash(make_init_data(1001));

   bool result = true;
   REQUIRE_NOTHROW(result = verifier.verify(body));
   REQUIRE_FALSE(result);

   REQUIRE_NOTHROW(result = verifier.verify(body + "&hash="));
   REQUIRE_FALSE(result);
}

TEST_CASE("Malformed payloads are rejected without throwing", "[init_data][verify]") {
   init_data_verifier verifier(LOOTBANK_TEST_BOT_TOKEN);
   const std::string payload = make_init_data(1001);
   const std::string hash = hash_of(payload);

   bool result = true;
   REQUIRE_NOTHROW(result = verifier.verify(""));
   REQUIRE_FALSE(result);
   REQUIRE_NOTHROW(result = verifier.verify("&&&"));
   REQUIRE_FALSE(result);
   REQUIRE_NOTHROW(result = verifier.verify("garbage"));
   REQUIRE_FALSE(result);

   // A repeated key makes the check string ambiguous
   REQUIRE_NOTHROW(result = verifier.verify(payload + "&auth_date=1"));
   REQUIRE_FALSE(result);

   std::string upper = hash;
   for (auto& c : upper)
      c = char(std::toupper(static_cast<unsigned char>(c)));
   REQUIRE_NOTHROW(result = verifier.verify(without_hash(payload) + "&hash=" + upper));
   REQUIRE_FALSE(result);

   std::string oversized = payload + "&pad=" + std::string(LOOTBANK_MAX_INIT_DATA_LENGTH, 'x');
   REQUIRE_NOTHROW(result = verifier.verify(oversized));
   REQUIRE_FALSE(result);
}

// ============================================================================
// Identity extraction
// ============================================================================

TEST_CASE("extract_identity reads the user and auth date", "[init_data][identity]") {
   auto who = extract_identity(make_init_data(1001, "lucky_one"));

   REQUIRE(who.valid());
   REQUIRE(who->id == 1001);
   REQUIRE(who->username == "lucky_one");
   REQUIRE(who->first_name == "Test");
   REQUIRE(who->last_name == "User");
   REQUIRE(who->auth_date.sec_since_epoch() == LOOTBANK_TEST_AUTH_DATE);
}

TEST_CASE("extract_identity tolerates missing optional fields", "[init_data][identity]") {
   auto who = extract_identity("user=" + url_encode("{\"id\":77}"));

   REQUIRE(who.valid());
   REQUIRE(who->id == 77);
   REQUIRE(who->username.empty());
   REQUIRE(who->first_name.empty());
   REQUIRE(who->auth_date.sec_since_epoch() == 0);
}

TEST_CASE("extract_identity leaves auth dates outside the seconds range unset", "[init_data][identity]") {
   const std::string user = "user=" + url_encode("{\"id\":77}");

   auto negative = extract_identity(user + "&auth_date=-1");
   REQUIRE(negative.valid());
   REQUIRE(negative->auth_date.sec_since_epoch() == 0);

   auto too_late = extract_identity(user + "&auth_date=4294967296");
   REQUIRE(too_late.valid());
   REQUIRE(too_late->auth_date.sec_since_epoch() == 0);

   auto last_second = extract_identity(user + "&auth_date=4294967295");
   REQUIRE(last_second.valid());
   REQUIRE(last_second->auth_date.sec_since_epoch() == 4294967295u);
}

TEST_CASE("extract_identity rejects payloads without a usable user", "[init_data][identity]") {
   REQUIRE_FALSE(extract_identity("auth_date=1700000000").valid());
   REQUIRE_FALSE(extract_identity("user=not-json").valid());
   REQUIRE_FALSE(extract_identity("user=" + url_encode("[1,2,3]")).valid());
   REQUIRE_FALSE(extract_identity("user=" + url_encode("{\"username\":\"x\"}")).valid());
   REQUIRE_FALSE(extract_identity("user=" + url_encode("{\"id\":\"12\"}")).valid());
   REQUIRE_FALSE(extract_identity("user=" + url_encode("{\"id\":0}")).valid());
   REQUIRE_FALSE(extract_identity("user=%7").valid());
}
