/**
 * @file test_error_items.cpp
 * @brief Layer 3 tests for ErrorItem, the DatabaseErrorItems catalog and DefaultErrorMapper.
 */
#include "dgt_gateway.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace docgate::gateway;
using nlohmann::json;
using ::testing::HasSubstr;
using ::testing::Not;

// ============================================================================
// ErrorItem
// ============================================================================

TEST(ErrorItemTest, LevelNamesRoundTrip)
{
    for (auto level : {ErrorLevel::SystemInfo, ErrorLevel::Warning, ErrorLevel::Severe,
                       ErrorLevel::Danger})
        EXPECT_EQ(error_level_from_string(to_string(level)), level);
    EXPECT_EQ(error_level_from_string("catastrophic"), ErrorLevel::SystemInfo);
    EXPECT_EQ(error_level_from_string(""), ErrorLevel::SystemInfo);
}

TEST(ErrorItemTest, ToStringWithAndWithoutMeta)
{
    ErrorItem bare{"Boom", "E1", "went wrong", ErrorLevel::Warning, json::object()};
    EXPECT_EQ(bare.to_string(), "Boom (E1): went wrong | Level: warning");

    auto with = bare.with_meta("location", "here");
    EXPECT_EQ(with.to_string(),
              "Boom (E1): went wrong | Meta: {\"location\":\"here\"} | Level: warning");
    EXPECT_TRUE(bare.meta.empty()) << "with_meta must not modify the original";
}

TEST(ErrorItemTest, JsonUsesErrorLevelKey)
{
    ErrorItem item{"T", "C", "D", ErrorLevel::Danger, json{{"k", 1}}};
    json j = item;
    EXPECT_EQ(j["errorLevel"], "danger");
    EXPECT_EQ(j["meta"]["k"], 1);
    EXPECT_EQ(j.get<ErrorItem>(), item);
}

TEST(ErrorItemTest, FromJsonToleratesMissingAndOddFields)
{
    auto item = json{{"title", "T"}, {"code", 404}, {"meta", "not-an-object"}}.get<ErrorItem>();
    EXPECT_EQ(item.title, "T");
    EXPECT_EQ(item.code, "404");
    EXPECT_EQ(item.description, "");
    EXPECT_TRUE(item.meta.is_object());
    EXPECT_EQ(item.level, ErrorLevel::SystemInfo);
}

// ============================================================================
// DatabaseErrorItems
// ============================================================================

TEST(DatabaseErrorItemsTest, CatalogEntriesCarrySource)
{
    for (const auto &item :
         {DatabaseErrorItems::connection_failed(), DatabaseErrorItems::not_found(),
          DatabaseErrorItems::stream_closed(), DatabaseErrorItems::deadlock(),
          DatabaseErrorItems::unknown()})
    {
        EXPECT_EQ(item.meta.value(DatabaseErrorItems::kSourceKey, ""),
                  DatabaseErrorItems::kSourceValue)
            << item.code;
    }
}

TEST(DatabaseErrorItemsTest, KnownCodesAndLevels)
{
    EXPECT_EQ(DatabaseErrorItems::not_found().code, "DB_NOT_FOUND");
    EXPECT_EQ(DatabaseErrorItems::not_found().level, ErrorLevel::Warning);
    EXPECT_EQ(DatabaseErrorItems::stream_closed().code, "DB_STREAM_CLOSED");
    EXPECT_EQ(DatabaseErrorItems::stream_closed().level, ErrorLevel::Warning);
    EXPECT_EQ(DatabaseErrorItems::connection_failed().level, ErrorLevel::Danger);
    EXPECT_EQ(DatabaseErrorItems::unavailable().level, ErrorLevel::Severe);
}

TEST(DatabaseErrorItemsTest, FromCodeLooksUpCatalog)
{
    EXPECT_EQ(DatabaseErrorItems::from_code("DB_TIMEOUT"), DatabaseErrorItems::timeout());
    EXPECT_EQ(DatabaseErrorItems::from_code("DB_CONFLICT"), DatabaseErrorItems::conflict());

    auto unknown = DatabaseErrorItems::from_code("DB_MARTIAN");
    EXPECT_EQ(unknown.code, "DB_UNKNOWN");
    EXPECT_EQ(unknown.description, "Unrecognized Database code: DB_MARTIAN");
}

// ============================================================================
// DefaultErrorMapper
// ============================================================================

TEST(DefaultErrorMapperTest, MapsStdException)
{
    DefaultErrorMapper mapper;
    auto item = mapper.from_exception(std::make_exception_ptr(std::runtime_error("socket reset")),
                                      "Gateway.read");
    EXPECT_EQ(item.title, "Unexpected error");
    EXPECT_EQ(item.code, "ERR_UNEXPECTED");
    EXPECT_EQ(item.description, "socket reset");
    EXPECT_EQ(item.level, ErrorLevel::Severe);
    EXPECT_EQ(item.meta["location"], "Gateway.read");
    EXPECT_THAT(item.meta["type"].get<std::string>(), HasSubstr("runtime_error"));
}

TEST(DefaultErrorMapperTest, MapsNonStdException)
{
    DefaultErrorMapper mapper;
    auto item = mapper.from_exception(std::make_exception_ptr(17), "Gateway.write");
    EXPECT_EQ(item.code, "ERR_UNEXPECTED");
    EXPECT_EQ(item.description, "unknown exception");
    EXPECT_EQ(item.meta["location"], "Gateway.write");
}

TEST(DefaultErrorMapperTest, NestedErrorObject)
{
    DefaultErrorMapper mapper;
    json payload = {{"error",
                     {{"title", "Denied"},
                      {"code", "E_ACL"},
                      {"message", "no access"},
                      {"errorLevel", "danger"},
                      {"meta", {{"user", "u1"}}}}}};
    auto item = mapper.from_payload(payload, "loc");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->title, "Denied");
    EXPECT_EQ(item->code, "E_ACL");
    EXPECT_EQ(item->description, "no access");
    EXPECT_EQ(item->level, ErrorLevel::Danger);
    EXPECT_EQ(item->meta["user"], "u1");
    EXPECT_EQ(item->meta["location"], "loc");
}

TEST(DefaultErrorMapperTest, TopLevelCodeWithDescription)
{
    DefaultErrorMapper mapper;
    auto item = mapper.from_payload(
        json{{"code", "E42"}, {"description", "desc wins"}, {"message", "msg"}}, "loc");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->title, "Operation failed");
    EXPECT_EQ(item->code, "E42");
    EXPECT_EQ(item->description, "desc wins");
}

TEST(DefaultErrorMapperTest, OkFalseAndSuccessFalse)
{
    DefaultErrorMapper mapper;
    auto a = mapper.from_payload(json{{"ok", false}}, "loc");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->code, "ERR_PAYLOAD");
    EXPECT_EQ(a->description, "Unknown error");

    auto b = mapper.from_payload(json{{"success", false}, {"message", "nope"}}, "loc");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->description, "nope");
}

TEST(DefaultErrorMapperTest, OrdinaryPayloadsAreNotErrors)
{
    DefaultErrorMapper mapper;
    EXPECT_FALSE(mapper.from_payload(json::object(), "loc").has_value());
    EXPECT_FALSE(mapper.from_payload(json{{"name", "Ana"}, {"ok", true}}, "loc").has_value());
    EXPECT_FALSE(mapper.from_payload(json{{"code", "only-code"}}, "loc").has_value());
    EXPECT_FALSE(mapper.from_payload(json{{"error", "string, not object"}}, "loc").has_value());
    EXPECT_FALSE(mapper.from_payload(json::array({1, 2}), "loc").has_value());
}

TEST(DefaultErrorMapperTest, CustomKeys)
{
    ErrorMapperKeys keys;
    keys.error_key = "fault";
    keys.payload_code = "E_CUSTOM";
    DefaultErrorMapper mapper(keys);

    auto item = mapper.from_payload(json{{"fault", {{"message", "m"}}}}, "loc");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->code, "E_CUSTOM");
    EXPECT_THAT(item->to_string(), Not(HasSubstr("ERR_PAYLOAD")));
}
