#include "TestHelpers.hpp"
#include "common/utils/Response.hpp"

namespace {

drogon::HttpRequestPtr requestWith(const std::map<std::string, std::string>& params) {
    auto req = drogon::HttpRequest::newHttpRequest();
    for (const auto& [k, v] : params) req->setParameter(k, v);
    return req;
}

}  // namespace

TEST(PaginationTest, UnpagedUnlessBothParametersGiven) {
    auto p = Pagination::fromRequest(requestWith({{"page", "2"}}));
    EXPECT_FALSE(p.isPaged());
    EXPECT_EQ(p.limitClause(), " LIMIT " + std::to_string(Constants::MAX_UNPAGED_ROWS));
}

TEST(PaginationTest, ClampsAndComputesOffset) {
    auto p = Pagination::fromRequest(requestWith({{"page", "3"}, {"pageSize", "500"}}));
    EXPECT_EQ(p.pageSize, Pagination::MAX_PAGE_SIZE);
    EXPECT_EQ(p.offset, 200);
    EXPECT_EQ(p.limitClause(), " LIMIT 100 OFFSET 200");

    auto bad = Pagination::fromRequest(requestWith({{"page", "-4"}, {"pageSize", "ten"}}));
    EXPECT_EQ(bad.page, 1);
    EXPECT_EQ(bad.pageSize, Pagination::DEFAULT_PAGE_SIZE);
    EXPECT_EQ(bad.offset, 0);
}

TEST(PaginationTest, PageResponseCarriesTotals) {
    Pagination p;
    p.page = 2;
    p.pageSize = 10;
    p.offset = 10;

    Json::Value items(Json::arrayValue);
    items.append(1);
    auto resp = Response::page(items, 21, p);
    ASSERT_TRUE(resp->getJsonObject());
    const auto& data = (*resp->getJsonObject())["data"];
    EXPECT_EQ(data["total"].asInt(), 21);
    EXPECT_EQ(data["totalPages"].asInt(), 3);
    EXPECT_EQ(data["list"].size(), 1u);

    auto unpaged = Response::page(Json::Value(), 0, Pagination{});
    const auto& body = *unpaged->getJsonObject();
    EXPECT_TRUE(body["data"]["list"].isArray());
    EXPECT_FALSE(body["data"].isMember("totalPages"));
}

TEST(QueryBuilderTest, SkipsEmptyValuesAndKeepsParameterOrder) {
    QueryBuilder qb;
    qb.eq("location_id", "")
      .eq("status", "running", "::run_status_enum")
      .when(true, "NOT is_acknowledged")
      .when(false, "never")
      .eq("location_id", "gully-1");

    EXPECT_EQ(qb.whereClause(), " WHERE status = ?::run_status_enum AND NOT is_acknowledged AND location_id = ?");
    ASSERT_EQ(qb.params().size(), 2u);
    EXPECT_EQ(qb.params()[0], "running");
    EXPECT_EQ(qb.params()[1], "gully-1");
    EXPECT_EQ(QueryBuilder().whereClause(), "");
}

TEST(ResponseTest, ErrorFromExceptionKeepsCodeAndStatus) {
    auto resp = Response::error(DuplicateDispatchException());
    EXPECT_EQ(resp->statusCode(), drogon::k409Conflict);
    EXPECT_EQ((*resp->getJsonObject())["code"].asInt(), ErrorCodes::DUPLICATE_DISPATCH);
}
