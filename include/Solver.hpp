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
 * @file Solver.hpp
 * @brief MNA assembly, DC analysis and result extraction entrypoints.
 *
 * This header exposes the stages of one DC analysis:
 *  - Assign matrix columns to nets and voltage-source branch currents,
 *  - Assemble the MNA matrix and RHS from element stamps,
 *  - Solve the system and map the solution back to per-component voltage,
 *    current, power and powered state,
 *  - Run the whole pipeline (`runAnalysis`) or the command-line workflow
 *    (`runSolver`).
 *
 * Every call builds its own nets, matrix and result; nothing is cached or
 * shared between calls, so separate circuits may be analysed concurrently.
 */
#pragma once

#include <Eigen/Dense>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "AnalysisOptions.hpp"
#include "Circuit.hpp"
#include "NetResolver.hpp"
#include "SimulationResult.hpp"

/**
 * @struct MNASystem
 * @brief Assembled linear system plus the index maps used to build it.
 *
 * Columns [0, netCount) are node voltages of the non-ground nets; columns
 * [netCount, size()) are branch currents of the voltage sources in circuit
 * order.
 */
struct MNASystem
{
    std::vector<std::vector<double>> mna;
    std::vector<double> rhs;
    /** @brief Net representative -> column of its voltage unknown. */
    std::map<int, int> netIndex;
    /** @brief Voltage source id -> column of its branch-current unknown. */
    std::map<std::string, int> branchIndex;
    int netCount = 0;

    int size() const { return static_cast<int>(rhs.size()); }
};

/**
 * @brief Build the net -> index and source -> index maps.
 *
 * Nets are numbered in order of first appearance while walking the
 * components in circuit order (p1 before p2); the ground net is skipped.
 * Voltage sources follow, one column each, in circuit order.
 *
 * @param[in] circuit Circuit being analysed.
 * @param[in] nets Resolved nets.
 * @param[out] netIndex Net representative -> column.
 * @param[out] branchIndex Source id -> column.
 * @return Number of net unknowns.
 */
int makeIndexMap(const Circuit &circuit, const NetMap &nets,
                 std::map<int, int> &netIndex,
                 std::map<std::string, int> &branchIndex);

/**
 * @brief Matrix indices an element stamps into.
 *
 * Pins on the ground net (or on a net without a column) map to GROUND_INDEX.
 */
StampIndices stampIndicesFor(const CircuitElement &element,
                             const NetMap &nets, const MNASystem &system);

/**
 * @brief Assemble the MNA matrix and RHS for a resolved circuit.
 *
 * @param[in] circuit Circuit being analysed.
 * @param[in] nets Resolved nets (from `resolveNets`).
 * @return Square system of dimension (#non-ground nets) + (#sources).
 */
MNASystem assembleMNA(const Circuit &circuit, const NetMap &nets);

/**
 * @brief Print the MNA matrix and RHS vector (debug helper).
 */
void printMNAandRHS(const MNASystem &system);

/**
 * @brief Copy a row-major vector-of-vectors matrix into an Eigen matrix.
 */
Eigen::MatrixXd toEigenMatrix(const std::vector<std::vector<double>> &mna);

/**
 * @brief Voltage of a net in a solved system (0 for ground, for nets
 * without a column and for non-finite entries).
 */
double netVoltage(int net, const NetMap &nets, const MNASystem &system,
                  const Eigen::VectorXd &x);

/**
 * @brief Map a solution vector back to per-component results.
 *
 * @param[in] circuit Circuit being analysed.
 * @param[in] nets Resolved nets.
 * @param[in] system Assembled system (index maps).
 * @param[in] x Solution vector of length `system.size()`.
 * @param[in] options Powered threshold.
 * @return Immutable result snapshot.
 */
SimulationResult extractResults(const Circuit &circuit, const NetMap &nets,
                                const MNASystem &system,
                                const Eigen::VectorXd &x,
                                const AnalysisOptions &options);

/**
 * @brief Run a complete DC analysis.
 *
 * Resolves nets, assembles and solves the MNA system, and extracts results.
 * A solver failure is reported on stderr and degrades to an all-zero
 * solution; it never propagates to the caller.
 *
 * @param[in] circuit Circuit to analyse.
 * @param[in] options Analysis options (validated first).
 * @return Fresh result snapshot.
 * @throws std::invalid_argument if `options` fails validation.
 */
SimulationResult runAnalysis(const Circuit &circuit,
                             const AnalysisOptions &options = AnalysisOptions());

/**
 * @brief Ids of powered components only (the boolean view of a result).
 */
std::set<std::string> poweredComponents(
    const Circuit &circuit, const AnalysisOptions &options = AnalysisOptions());

/**
 * @brief Print one line per component: id, label, kind, V, I, P, powered.
 */
void printResult(const Circuit &circuit, const SimulationResult &result);

/**
 * @brief Run the top-level workflow for a board file.
 *
 *  - Determine the input filename (from argv or default).
 *  - Parse the board description.
 *  - Run the analysis, print the result table and the verdict.
 *
 * @param[in] argc Count of command-line arguments.
 * @param[in] argv argv[1] is the board file when argc > 1.
 * @param[in] options Analysis options.
 * @return 0 on success, non-zero on fatal error (parse failures).
 */
int runSolver(int argc, char *argv[],
              const AnalysisOptions &options = AnalysisOptions());

/* End of Solver.hpp */
