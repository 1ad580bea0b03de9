/**
 * @file main.cpp
 * @brief Entry point of the casechain command-line tool.
 */

#include "app/CaseChainApp.hpp"

int main(int argc, char** argv) {
    casechain::app::CaseChainApp app;
    return app.Run(argc, argv);
}
