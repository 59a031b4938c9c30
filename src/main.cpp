#include "LedgerApp.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;

        std::clog << "========================================" << std::endl;
        std::clog << "  Portfolio Ledger v1.0.0" << std::endl;
        std::clog << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        return app.run(argc, argv);

    } catch (const ledger::domain::LedgerException& e) {
        std::cerr << "[main] " << ledger::domain::toString(e.kind()) << ": " << e.what() << std::endl;
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] " << e.what() << std::endl;
        ledger::LedgerApp::printUsage(std::cerr);
        return 64;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
