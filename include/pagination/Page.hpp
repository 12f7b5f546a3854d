#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace authcore::pagination {

/**
 * @brief Аргументы постраничного запроса от клиента
 *
 * Задаётся не более одного из first/last. Курсоры непрозрачные.
 */
struct PageArgs {
    std::optional<int> first;
    std::optional<int> last;
    std::optional<std::string> before;
    std::optional<std::string> after;
};

/**
 * @brief Запрос к хранилищу по монотонному id
 *
 * limit уже включает один лишний элемент для определения hasNext/hasPrevious.
 * backward: выбрать последние limit записей перед beforeId (по убыванию id).
 * activeAt: записи с expires_at раньше этого момента не попадают в выборку.
 */
struct KeysetQuery {
    std::optional<int64_t> afterId;
    std::optional<int64_t> beforeId;
    size_t limit = 0;
    bool backward = false;
    std::optional<domain::TimePoint> activeAt;
};

/**
 * @brief Страница результатов, элементы по возрастанию id
 */
template <typename T>
struct Page {
    std::vector<T> items;
    bool hasNext = false;
    bool hasPrevious = false;
    std::optional<std::string> startCursor;
    std::optional<std::string> endCursor;
};

} // namespace authcore::pagination
