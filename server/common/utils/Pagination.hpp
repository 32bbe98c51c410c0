#pragma once

#include "Constants.hpp"

/**
 * @brief 列表分页参数
 *
 * page 与 pageSize 同时给出才分页；否则返回全部，最多 MAX_UNPAGED_ROWS 行。
 */
struct Pagination {
    static constexpr int DEFAULT_PAGE_SIZE = 10;
    static constexpr int MAX_PAGE_SIZE = 100;

    int page = 1;
    int pageSize = 0;
    int offset = 0;

    bool isPaged() const { return pageSize > 0; }

    static Pagination fromRequest(const drogon::HttpRequestPtr& req) {
        Pagination p;
        auto pageText = req->getParameter("page");
        auto sizeText = req->getParameter("pageSize");
        if (pageText.empty() || sizeText.empty()) return p;

        p.pageSize = std::clamp(parseInt(sizeText).value_or(DEFAULT_PAGE_SIZE), 1, MAX_PAGE_SIZE);
        p.page = std::max(parseInt(pageText).value_or(1), 1);
        p.offset = (p.page - 1) * p.pageSize;
        return p;
    }

    std::string limitClause() const {
        if (!isPaged()) return " LIMIT " + std::to_string(Constants::MAX_UNPAGED_ROWS);
        return " LIMIT " + std::to_string(pageSize) + " OFFSET " + std::to_string(offset);
    }

private:
    static std::optional<int> parseInt(std::string_view s) {
        int value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
        return value;
    }
};

/**
 * @brief WHERE 条件拼接，参数按出现顺序绑定到 ? 占位符
 */
class QueryBuilder {
public:
    /**
     * @brief 等值条件，value 为空时忽略；cast 用于枚举列（如 "::run_status_enum"）
     */
    QueryBuilder& eq(const std::string& field, const std::string& value, const std::string& cast = "") {
        if (!value.empty()) {
            conditions_.push_back(field + " = ?" + cast);
            params_.push_back(value);
        }
        return *this;
    }

    /** 无参数条件，enabled 为 false 时忽略 */
    QueryBuilder& when(bool enabled, const std::string& condition) {
        if (enabled) conditions_.push_back(condition);
        return *this;
    }

    std::string whereClause() const {
        std::string clause;
        for (const auto& c : conditions_) {
            clause += clause.empty() ? " WHERE " : " AND ";
            clause += c;
        }
        return clause;
    }

    const std::vector<std::string>& params() const { return params_; }

private:
    std::vector<std::string> conditions_;
    std::vector<std::string> params_;
};
