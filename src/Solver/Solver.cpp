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
 * @file Solver.cpp
 * @brief Implementation of MNA assembly, DC analysis and result extraction.
 *
 * This file contains the concrete implementations for the routines declared
 * in `Solver.hpp`:
 *
 *  - Building net->index and source->index maps for the unknowns.
 *  - Assembling the MNA matrix by asking every element for its stamp.
 *  - Running the analysis: resolve nets, assemble, solve, extract.
 *  - The command-line workflow (parse board, analyse, print, classify).
 *
 * Implementation notes (concise):
 *  - Stamps are written into std::vector storage and mapped into Eigen for
 *    the solve.
 *  - The linear solver resolves floating nets to 0 V on its own; anything it
 *    throws is treated as "no solution" and replaced by an all-zero vector so
 *    callers always receive a complete result.
 */

#include "Solver.hpp"

#include <cmath>
#include <exception>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <utility>

#include "LinearSolver.hpp"
#include "Parser.hpp"
#include "Verdict.hpp"

int makeIndexMap(const Circuit &circuit, const NetMap &nets,
                 std::map<int, int> &netIndex,
                 std::map<std::string, int> &branchIndex)
{
    netIndex.clear();
    branchIndex.clear();

    int i = 0;
    for (const auto &element : circuit.components()) {
        auto pinIter = nets.pinOf.find(element->getId());
        if (pinIter == nets.pinOf.end()) continue;

        for (int net : {pinIter->second.p1, pinIter->second.p2}) {
            if (net == nets.groundNet) continue;
            if (netIndex.count(net) == 0) netIndex[net] = i++;
        }
    }
    const int netCount = i;

    // Branch currents follow the node voltages, in circuit order.
    for (const auto &element : circuit.components()) {
        if (element->needsBranchCurrent()) branchIndex[element->getId()] = i++;
    }

    return netCount;
}

StampIndices stampIndicesFor(const CircuitElement &element,
                             const NetMap &nets, const MNASystem &system)
{
    StampIndices indices;

    auto pinIter = nets.pinOf.find(element.getId());
    if (pinIter != nets.pinOf.end()) {
        auto p1Iter = system.netIndex.find(pinIter->second.p1);
        if (p1Iter != system.netIndex.end()) indices.p1 = p1Iter->second;
        auto p2Iter = system.netIndex.find(pinIter->second.p2);
        if (p2Iter != system.netIndex.end()) indices.p2 = p2Iter->second;
    }

    auto branchIter = system.branchIndex.find(element.getId());
    if (branchIter != system.branchIndex.end())
        indices.branch = branchIter->second;

    return indices;
}

MNASystem assembleMNA(const Circuit &circuit, const NetMap &nets)
{
    MNASystem system;
    system.netCount =
        makeIndexMap(circuit, nets, system.netIndex, system.branchIndex);

    const int n =
        system.netCount + static_cast<int>(system.branchIndex.size());
    system.mna.assign(n, std::vector<double>(n, 0.0));
    system.rhs.assign(n, 0.0);

    for (const auto &element : circuit.components()) {
        element->stamp(system.mna, system.rhs,
                       stampIndicesFor(*element, nets, system));
    }

    return system;
}

void printMNAandRHS(const MNASystem &system)
{
    const int n = system.size();

    // Row labels: V(net) for node unknowns, I(id) for branch currents
    std::vector<std::string> names(n);
    for (const auto &p : system.netIndex) {
        names[p.second] = "V(net" + std::to_string(p.first) + ")";
    }
    for (const auto &p : system.branchIndex) {
        names[p.second] = "I(" + p.first + ")";
    }

    std::cout << std::fixed;
    std::cout << std::setprecision(5);

    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            std::cout << system.mna[i][j] << "\t\t";
        }
        std::cout << "\t\t" << names[i] << "\t\t" << system.rhs[i]
                  << std::endl;
    }
}

Eigen::MatrixXd toEigenMatrix(const std::vector<std::vector<double>> &mna)
{
    const int n = static_cast<int>(mna.size());
    if (n == 0) return Eigen::MatrixXd(0, 0);

    std::vector<double> flat;
    flat.reserve(static_cast<size_t>(n) * n);
    for (int i = 0; i < n; ++i)
        for (int j = 0; j < n; ++j) flat.push_back(mna[i][j]);

    // Row-major data viewed column-major, then transposed
    Eigen::MatrixXd A = Eigen::MatrixXd::Map(flat.data(), n, n).transpose();
    return A;
}

double netVoltage(int net, const NetMap &nets, const MNASystem &system,
                  const Eigen::VectorXd &x)
{
    if (net == nets.groundNet) return 0.0;

    auto it = system.netIndex.find(net);
    if (it == system.netIndex.end()) return 0.0;
    if (it->second >= x.size()) return 0.0;

    double v = x(it->second);
    return std::isfinite(v) ? v : 0.0;
}

SimulationResult extractResults(const Circuit &circuit, const NetMap &nets,
                                const MNASystem &system,
                                const Eigen::VectorXd &x,
                                const AnalysisOptions &options)
{
    std::map<std::string, double> voltages;
    std::map<std::string, double> currents;
    std::map<std::string, double> powers;
    std::set<std::string> powered;

    for (const auto &element : circuit.components()) {
        const std::string id = element->getId();

        PinNets pins;
        auto pinIter = nets.pinOf.find(id);
        if (pinIter != nets.pinOf.end()) pins = pinIter->second;

        double v1 = netVoltage(pins.p1, nets, system, x);
        double v2 = netVoltage(pins.p2, nets, system, x);

        StampIndices indices = stampIndicesFor(*element, nets, system);
        double current = element->computeCurrent(v1, v2, x, indices);

        // Voltage shown for a component is its p1 net
        voltages[id] = v1;
        currents[id] = current;
        powers[id] = std::abs(current * (v1 - v2));

        if (element->getKind() == ComponentKind::Source ||
            std::abs(v1) > options.poweredThreshold ||
            std::abs(v2) > options.poweredThreshold) {
            powered.insert(id);
        }
    }

    return SimulationResult(std::move(voltages), std::move(currents),
                            std::move(powers), std::move(powered));
}

SimulationResult runAnalysis(const Circuit &circuit,
                             const AnalysisOptions &options)
{
    options.validate();

    NetMap nets = resolveNets(circuit);
    if (!circuit.empty() && !nets.hasGround()) {
        std::cerr << "Warning: Circuit has no ground and no voltage source; "
                     "node voltages are unreferenced"
                  << std::endl;
    }

    MNASystem system = assembleMNA(circuit, nets);
    if (options.printMatrix) printMNAandRHS(system);

    const int n = system.size();
    Eigen::VectorXd x = Eigen::VectorXd::Zero(n);
    if (n > 0) {
        try {
            Eigen::VectorXd rhs =
                Eigen::Map<const Eigen::VectorXd>(system.rhs.data(), n);
            x = solveLinearSystem(toEigenMatrix(system.mna), rhs,
                                  options.pivotTolerance);
        } catch (const std::exception &ex) {
            std::cerr << "Solver failed: " << ex.what() << std::endl;
            x = Eigen::VectorXd::Zero(n);
        }
    }

    return extractResults(circuit, nets, system, x, options);
}

std::set<std::string> poweredComponents(const Circuit &circuit,
                                        const AnalysisOptions &options)
{
    return runAnalysis(circuit, options).poweredSet();
}

void printResult(const Circuit &circuit, const SimulationResult &result)
{
    std::cout << std::fixed;
    std::cout << std::setprecision(5);

    std::cout << "\n"
              << std::left << std::setw(10) << "ID" << std::setw(18)
              << "LABEL" << std::setw(12) << "KIND" << std::right
              << std::setw(14) << "V(p1)" << std::setw(14) << "I"
              << std::setw(14) << "P" << "  POWERED" << std::endl;

    for (const auto &element : circuit.components()) {
        const std::string id = element->getId();
        std::cout << std::left << std::setw(10) << id << std::setw(18)
                  << element->getLabel() << std::setw(12)
                  << element->getKindName() << std::right << std::setw(14)
                  << result.voltage(id) << std::setw(14) << result.current(id)
                  << std::setw(14) << result.power(id) << "  "
                  << (result.isPowered(id) ? "yes" : "no") << std::endl;
    }
}

int runSolver(int argc, char *argv[], const AnalysisOptions &options)
{
    std::string fileName = "circuit.board";
    if (argc > 1) fileName = argv[1];

    Parser parser;
    int errors = parser.parse(fileName);
    if (errors > 0) {
        std::cerr << "Error: " << errors << " error(s) in board file '"
                  << fileName << "'" << std::endl;
        return 1;
    }

    parser.printElementCounts();

    SimulationResult result = runAnalysis(parser.circuit, options);
    printResult(parser.circuit, result);

    Verdict verdict = classifyResult(parser.circuit, result, options);
    std::cout << "\nVerdict: [" << verdict.state << "] " << verdict.message
              << " - " << verdict.details << std::endl;

    return 0;
}
