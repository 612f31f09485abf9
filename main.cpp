/**
 * @file main.cpp
 * @brief Entry point of the ledgerwalker command line tool.
 */

#include "app/LedgerWalkerApp.hpp"

int main(int argc, char** argv) {
    ledgerwalker::app::LedgerWalkerApp app;
    return app.Run(argc, argv);
}
