#pragma once

#include "domain/Price.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Цены инструментов
 *
 * Пишутся внешним сборщиком (upsert, last-write-wins по дате),
 * читаются оценкой портфеля. Отсутствие цены — не ошибка.
 */
class IPriceRepository {
public:
    virtual ~IPriceRepository() = default;

    virtual void upsert(const domain::Price& price) = 0;
    virtual std::optional<domain::Price> findLatest(int64_t investmentId) = 0;
    virtual std::optional<domain::Price> findByDate(int64_t investmentId, const std::string& priceDate) = 0;

    /**
     * @brief История цен, новые первыми
     */
    virtual std::vector<domain::Price> findHistory(int64_t investmentId, int limit) = 0;
};

} // namespace ledger::ports::output
