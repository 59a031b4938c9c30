// include/application/ValuationReport.hpp
#pragma once

#include "ports/input/IValuationService.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledger::application {

/**
 * @brief Вывод оценки в JSON
 *
 * В поток out пишется только JSON-документ (один пользователь или массив всех).
 * При заданном outputPath документ пишется в файл, а out не трогается.
 * Диагностика идёт в std::clog.
 */
class ValuationReport {
public:
    ValuationReport(
        std::shared_ptr<ports::input::IValuationService> valuationService,
        std::ostream& out
    ) : valuationService_(std::move(valuationService))
      , out_(out)
    {}

    void write(
        const std::optional<int64_t>& userId,
        const std::optional<std::string>& asOfDate,
        const std::optional<std::string>& outputPath = std::nullopt
    ) {
        std::string json = userId
            ? valuationService_->valueUser(*userId, asOfDate).toJson()
            : domain::toJson(valuationService_->valueAllUsers(asOfDate));

        if (outputPath) {
            std::ofstream file(*outputPath);
            if (!file) {
                throw std::runtime_error("Cannot open output file: " + *outputPath);
            }
            file << json << std::endl;
            std::clog << "[ValuationReport] Valuation written to " << *outputPath << std::endl;
            return;
        }
        out_ << json << std::endl;
    }

private:
    std::shared_ptr<ports::input::IValuationService> valuationService_;
    std::ostream& out_;
};

} // namespace ledger::application
