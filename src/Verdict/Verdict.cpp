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
 * @file Verdict.cpp
 * @brief Banner classification for a finished analysis.
 */

#include "Verdict.hpp"

#include <cmath>
#include <string>

Verdict classifyResult(const Circuit& circuit, const SimulationResult& result,
                       const AnalysisOptions& options)
{
    Verdict verdict;

    for (const auto& element : circuit.components()) {
        ComponentKind kind = element->getKind();
        if (kind == ComponentKind::Source || kind == ComponentKind::Ground ||
            kind == ComponentKind::Switch)
            continue;

        double power = result.power(element->getId());
        if (power > options.maxSafePower) {
            verdict.state = VerdictState::Danger;
            verdict.message = "CIRCUIT FAILURE";
            verdict.details = element->getLabel() + " is overheating (" +
                              std::to_string(std::llround(power * 1000.0)) +
                              "mW)";
            return verdict;
        }
    }

    for (const auto& element : circuit.components()) {
        if (element->getKind() != ComponentKind::Led) continue;

        if (std::abs(result.current(element->getId())) >
            options.ledActiveCurrent) {
            verdict.state = VerdictState::Success;
            verdict.message = "CIRCUIT FUNCTIONAL";
            verdict.details = element->getLabel() + " is active";
            return verdict;
        }
    }

    verdict.state = VerdictState::Neutral;
    verdict.message = "SIMULATING...";
    verdict.details = "Analyzing current flow...";
    return verdict;
}
