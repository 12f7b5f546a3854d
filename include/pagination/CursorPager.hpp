#pragma once

#include "pagination/Page.hpp"
#include "security/Base64Url.hpp"
#include "domain/errors/CredentialException.hpp"
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <limits>
#include <cctype>
#include <cstdint>

namespace authcore::pagination {

/**
 * @brief Курсорная пагинация по монотонному id
 *
 * Курсор - base64url от десятичной записи id. Хранилище запрашивает
 * на один элемент больше страницы; лишний элемент отрезается и
 * выставляет hasNext (вперёд) или hasPrevious (назад).
 */
class CursorPager {
public:
    static constexpr int DEFAULT_PAGE_SIZE = 20;
    static constexpr int MAX_PAGE_SIZE = 100;

    /**
     * @return std::nullopt для id <= 0
     */
    static std::optional<std::string> cursorFor(int64_t id) {
        if (id <= 0) return std::nullopt;
        return security::Base64Url::encode(std::to_string(id));
    }

    /**
     * @brief Обратное к cursorFor
     * @return std::nullopt для пустого курсора (нет ограничения)
     * @throws domain::ValidationException если курсор повреждён
     */
    static std::optional<int64_t> idFor(const std::string& cursor) {
        if (cursor.empty()) return std::nullopt;

        auto decoded = security::Base64Url::decode(cursor);
        if (!decoded || decoded->empty() || decoded->size() > 19) {
            throw domain::ValidationException("invalid cursor");
        }
        // у каждого id ровно один курсор: ведущие нули не принимаем
        if ((*decoded)[0] == '0') {
            throw domain::ValidationException("invalid cursor");
        }

        int64_t id = 0;
        for (char c : *decoded) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw domain::ValidationException("invalid cursor");
            }
            int digit = c - '0';
            if (id > (std::numeric_limits<int64_t>::max() - digit) / 10) {
                throw domain::ValidationException("invalid cursor");
            }
            id = id * 10 + digit;
        }
        if (id <= 0) {
            throw domain::ValidationException("invalid cursor");
        }
        return id;
    }

    /**
     * @throws domain::ValidationException до любого обращения к хранилищу
     */
    static void validate(const PageArgs& args) {
        if (args.first && args.last) {
            throw domain::ValidationException("cannot specify both first and last parameters");
        }
        if (args.first && *args.first <= 0) {
            throw domain::ValidationException("first parameter must be positive");
        }
        if (args.last && *args.last <= 0) {
            throw domain::ValidationException("last parameter must be positive");
        }
    }

    /**
     * @brief Проверить аргументы и построить запрос к хранилищу
     */
    static KeysetQuery toQuery(const PageArgs& args) {
        validate(args);

        KeysetQuery query;
        query.afterId = args.after ? idFor(*args.after) : std::nullopt;
        query.beforeId = args.before ? idFor(*args.before) : std::nullopt;
        query.backward = args.last.has_value();
        query.limit = static_cast<size_t>(pageSize(args)) + 1;
        return query;
    }

    /**
     * @brief Собрать страницу из результата хранилища
     *
     * fetched - результат запроса toQuery(args): по возрастанию id для
     * прямого направления, по убыванию для обратного. Элемент должен
     * иметь поле id.
     */
    template <typename T>
    static Page<T> paginate(std::vector<T> fetched, const KeysetQuery& query) {
        size_t size = query.limit > 0 ? query.limit - 1 : 0;
        bool hasMore = fetched.size() > size;
        if (hasMore) {
            fetched.resize(size);
        }

        Page<T> page;
        if (query.backward) {
            std::reverse(fetched.begin(), fetched.end());
            page.hasPrevious = hasMore;
            page.hasNext = query.beforeId.has_value();
        } else {
            page.hasNext = hasMore;
            page.hasPrevious = query.afterId.has_value();
        }

        page.items = std::move(fetched);
        if (!page.items.empty()) {
            page.startCursor = cursorFor(page.items.front().id);
            page.endCursor = cursorFor(page.items.back().id);
        }
        return page;
    }

    /**
     * @brief Выборка по запросу из списка в памяти (по возрастанию id)
     */
    template <typename T>
    static std::vector<T> select(const std::vector<T>& ascending, const KeysetQuery& query) {
        std::vector<T> matched;
        for (const auto& item : ascending) {
            if (query.afterId && item.id <= *query.afterId) continue;
            if (query.beforeId && item.id >= *query.beforeId) continue;
            matched.push_back(item);
        }

        std::vector<T> result;
        if (query.backward) {
            for (auto it = matched.rbegin(); it != matched.rend() && result.size() < query.limit; ++it) {
                result.push_back(*it);
            }
        } else {
            for (const auto& item : matched) {
                if (result.size() >= query.limit) break;
                result.push_back(item);
            }
        }
        return result;
    }

    /**
     * @brief Пагинация уже загруженного списка (по возрастанию id)
     */
    template <typename T>
    static Page<T> paginate(const std::vector<T>& ascending, const PageArgs& args) {
        auto query = toQuery(args);
        return paginate(select(ascending, query), query);
    }

private:
    static int pageSize(const PageArgs& args) {
        int requested = args.first ? *args.first : (args.last ? *args.last : DEFAULT_PAGE_SIZE);
        return std::min(requested, MAX_PAGE_SIZE);
    }
};

} // namespace authcore::pagination
