/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file main.cpp
 *
 * @brief Command-line driver for the DC board analysis
 */

#include "main.hpp"

#include <getopt.h>

#include <iostream>
#include <string>

#include "AnalysisOptions.hpp"
#include "Solver.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [board-file]\n";
    std::cout << "Options:\n";
    std::cout << "  --max-safe-power <W>       Overheating threshold "
                 "(default 0.25)\n";
    std::cout << "  --led-current <A>          Current for a lit LED "
                 "(default 0.005)\n";
    std::cout << "  --powered-threshold <V>    Pin voltage counted as powered "
                 "(default 0.1)\n";
    std::cout << "  --pivot-tolerance <x>      Smallest usable pivot "
                 "(default 1e-10)\n";
    std::cout << "  --print-matrix             Dump the MNA system before "
                 "solving\n";
    std::cout << "  --help                     Show this help message\n";
}

int main(int argc, char *argv[])
{
    AnalysisOptions options;

    static struct option long_options[] = {
        {"max-safe-power", required_argument, 0, 0},
        {"led-current", required_argument, 0, 0},
        {"powered-threshold", required_argument, 0, 0},
        {"pivot-tolerance", required_argument, 0, 0},
        {"print-matrix", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    try {
        while ((c = getopt_long(argc, argv, "h", long_options,
                                &option_index)) != -1) {
            if (c == 'h') {
                printHelp(argv[0]);
                return 0;
            } else if (c == 0) {
                std::string name = long_options[option_index].name;
                if (name == "max-safe-power")
                    options.maxSafePower = std::stod(optarg);
                else if (name == "led-current")
                    options.ledActiveCurrent = std::stod(optarg);
                else if (name == "powered-threshold")
                    options.poweredThreshold = std::stod(optarg);
                else if (name == "pivot-tolerance")
                    options.pivotTolerance = std::stod(optarg);
                else if (name == "print-matrix")
                    options.printMatrix = true;
            } else {
                printHelp(argv[0]);
                return 1;
            }
        }

        // Validate options (throws on bad input)
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid analysis option: " << ex.what() << std::endl;
        return 1;
    }

    // Remaining non-option args: [board-file]
    std::string filename = "circuit.board";
    if (optind < argc) {
        filename = argv[optind];
    }

    // Prepare argc/argv for solver: program name + filename
    char *new_argv[2];
    new_argv[0] = argv[0];
    new_argv[1] = const_cast<char *>(filename.c_str());

    return runSolver(2, new_argv, options);
}
