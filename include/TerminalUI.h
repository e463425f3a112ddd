#pragma once
#include "CrossTable.h"
#include "GroupAggregator.h"

#include <iostream>
#include <string>

class TerminalUI {
public:
    static void printStatMatrix(const StatMatrix& stats, bool meanOnlyExpressed, std::ostream& out = std::cout);
    static void printCrossTable(const CrossTable& table, const std::string& x, const std::string& y,
                                bool percentages, std::ostream& out = std::cout);
};
