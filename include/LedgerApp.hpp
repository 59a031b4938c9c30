// include/LedgerApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/IsaAllowanceSettings.hpp"

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/input/IHoldingService.hpp"
#include "ports/input/IMovementService.hpp"
#include "ports/input/ICashLedgerService.hpp"
#include "ports/input/IReferenceDataService.hpp"
#include "ports/input/IValuationService.hpp"

// Application
#include "application/AccountService.hpp"
#include "application/HoldingService.hpp"
#include "application/MovementService.hpp"
#include "application/CashLedgerService.hpp"
#include "application/ReferenceDataService.hpp"
#include "application/ValuationService.hpp"
#include "application/ValuationReport.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresSchema.hpp"
#include "adapters/secondary/PostgresUnitOfWork.hpp"
#include "adapters/secondary/PostgresUserRepository.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresCurrencyRepository.hpp"
#include "adapters/secondary/PostgresInvestmentRepository.hpp"
#include "adapters/secondary/PostgresPriceRepository.hpp"
#include "adapters/secondary/PostgresExchangeRateRepository.hpp"
#include "adapters/secondary/PostgresHoldingRepository.hpp"
#include "adapters/secondary/PostgresHoldingMovementRepository.hpp"
#include "adapters/secondary/PostgresCashTransactionRepository.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace di = boost::di;

namespace ledger {

/**
 * @brief Portfolio Ledger Application
 *
 * Точка сборки: Boost.DI связывает порты с PostgreSQL-адаптерами.
 *
 * Команды:
 *   portfolio-ledger valuation [<userId>] [--as-of YYYY-MM-DD] [--output FILE]
 *
 * Без userId — оценка всех пользователей (JSON-массив).
 * В out попадает только JSON, журнал пишется в std::clog.
 */
class LedgerApp {
public:
    explicit LedgerApp(std::ostream& out = std::cout) : out_(out) {
        std::clog << "[LedgerApp] Initializing..." << std::endl;
    }
    ~LedgerApp() { std::clog << "[LedgerApp] Shutting down..." << std::endl; }

    /**
     * @brief Template Method: loadEnvironment → configureInjection → start
     * @return код возврата процесса
     */
    int run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        return start();
    }

    static void printUsage(std::ostream& out) {
        out << "Usage: portfolio-ledger valuation [<userId>] [--as-of YYYY-MM-DD] [--output FILE]"
            << std::endl;
    }

protected:
    void loadEnvironment(int argc, char* argv[]) {
        if (argc < 2) {
            throw std::invalid_argument("Command is required");
        }

        command_ = argv[1];
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--as-of" && i + 1 < argc) {
                asOfDate_ = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                outputPath_ = argv[++i];
            } else if (!userId_ && !arg.empty() && arg[0] != '-') {
                userId_ = parseId(arg);
            } else {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }

        std::clog << "[LedgerApp] Environment loaded" << std::endl;
    }

    void configureInjection() {
        std::clog << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::DbSettings>()
                .to(std::make_shared<settings::DbSettings>()),

            di::bind<settings::LedgerSettings>()
                .to(std::make_shared<settings::LedgerSettings>()),

            di::bind<settings::IsaAllowanceSettings>()
                .to(std::make_shared<settings::IsaAllowanceSettings>()),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::IUnitOfWorkFactory>()
                .to<adapters::secondary::PostgresUnitOfWorkFactory>()
                .in(di::singleton),

            di::bind<ports::output::IUserRepository>()
                .to<adapters::secondary::PostgresUserRepository>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::ICurrencyRepository>()
                .to<adapters::secondary::PostgresCurrencyRepository>()
                .in(di::singleton),

            di::bind<ports::output::IInvestmentRepository>()
                .to<adapters::secondary::PostgresInvestmentRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPriceRepository>()
                .to<adapters::secondary::PostgresPriceRepository>()
                .in(di::singleton),

            di::bind<ports::output::IExchangeRateRepository>()
                .to<adapters::secondary::PostgresExchangeRateRepository>()
                .in(di::singleton),

            di::bind<ports::output::IHoldingRepository>()
                .to<adapters::secondary::PostgresHoldingRepository>()
                .in(di::singleton),

            di::bind<ports::output::IHoldingMovementRepository>()
                .to<adapters::secondary::PostgresHoldingMovementRepository>()
                .in(di::singleton),

            di::bind<ports::output::ICashTransactionRepository>()
                .to<adapters::secondary::PostgresCashTransactionRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::IAccountService>()
                .to<application::AccountService>()
                .in(di::singleton),

            di::bind<ports::input::IReferenceDataService>()
                .to<application::ReferenceDataService>()
                .in(di::singleton),

            di::bind<ports::input::IHoldingService>()
                .to<application::HoldingService>()
                .in(di::singleton),

            di::bind<ports::input::IMovementService>()
                .to<application::MovementService>()
                .in(di::singleton),

            di::bind<ports::input::ICashLedgerService>()
                .to<application::CashLedgerService>()
                .in(di::singleton),

            di::bind<ports::input::IValuationService>()
                .to<application::ValuationService>()
                .in(di::singleton)
        );

        std::clog << "[LedgerApp] DI Injector configured:" << std::endl;
        std::clog << "  ✓ Secondary Adapters (10 bindings)" << std::endl;
        std::clog << "  ✓ Application Services (6 bindings)" << std::endl;

        auto schema = injector.create<std::shared_ptr<adapters::secondary::PostgresSchema>>();
        schema->init();

        valuationService_ = injector.create<std::shared_ptr<ports::input::IValuationService>>();

        std::clog << "[LedgerApp] Configuration complete" << std::endl;
    }

    int start() {
        if (command_ != "valuation") {
            throw std::invalid_argument("Unknown command: " + command_);
        }

        application::ValuationReport report(valuationService_, out_);
        report.write(userId_, asOfDate_, outputPath_);
        return 0;
    }

private:
    std::ostream& out_;
    std::string command_;
    std::optional<int64_t> userId_;
    std::optional<std::string> asOfDate_;
    std::optional<std::string> outputPath_;

    std::shared_ptr<ports::input::IValuationService> valuationService_;

    static int64_t parseId(const std::string& text) {
        std::size_t pos = 0;
        int64_t id = std::stoll(text, &pos);
        if (pos != text.size() || id <= 0) {
            throw std::invalid_argument("User id must be a positive integer: " + text);
        }
        return id;
    }
};

} // namespace ledger
