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
 * @file Verdict.hpp
 * @brief Safety / functional verdict derived from a simulation result.
 *
 * The renderer shows one banner per analysis. The classifier checks for an
 * overheating part first and only then for a lit LED, so a board that burns a
 * resistor is reported as failed even if an LED is also on.
 */

#pragma once

#include <iostream>
#include <string>

#include "AnalysisOptions.hpp"
#include "Circuit.hpp"
#include "SimulationResult.hpp"

/**
 * @enum VerdictState
 * @brief Banner state shown to the user.
 */
enum class VerdictState
{
    Neutral, /**< Nothing notable (yet) */
    Success, /**< An LED is lit */
    Danger   /**< A part dissipates more than the safe ceiling */
};

inline std::ostream& operator<<(std::ostream& os, VerdictState state)
{
    switch (state) {
        case VerdictState::Neutral:
            os << "neutral";
            break;
        case VerdictState::Success:
            os << "success";
            break;
        case VerdictState::Danger:
            os << "danger";
            break;
        default:
            os << "UnknownVerdictState";
            break;
    }
    return os;
}

/**
 * @struct Verdict
 * @brief Classifier output: state, headline and a detail line naming the
 * implicated component.
 */
struct Verdict
{
    VerdictState state = VerdictState::Neutral;
    std::string message;
    std::string details;
};

/**
 * @brief Classify a result.
 *
 * Components are scanned in circuit order:
 *  1. The first component that is not a source, ground or switch and whose
 *     power exceeds `options.maxSafePower` yields Danger.
 *  2. Otherwise the first LED with |current| above `options.ledActiveCurrent`
 *     yields Success.
 *  3. Otherwise the verdict is Neutral.
 *
 * @param circuit Circuit the result was computed for.
 * @param result Result snapshot.
 * @param options Thresholds.
 * @return Verdict for the banner.
 */
Verdict classifyResult(const Circuit& circuit, const SimulationResult& result,
                       const AnalysisOptions& options = AnalysisOptions());
