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

#pragma once

#include <stdexcept>
#include <string>

/*
 * AnalysisOptions.hpp
 *
 * Lightweight configuration container for the DC analysis and the verdict
 * classifier.
 *
 * The defaults reproduce the behaviour the editor expects; the command-line
 * driver and tests may override them. Callers should invoke `validate()`
 * after changing fields.
 */
/**
 * @struct AnalysisOptions
 * @brief Runtime options controlling solver tolerance and result thresholds.
 */
struct AnalysisOptions
{
    /**
     * @brief Pivot magnitude below which an unknown is treated as floating.
     *
     * During elimination a column whose best pivot is smaller than this is
     * skipped, and back-substitution resolves that unknown to exactly 0.
     */
    double pivotTolerance = 1e-10;

    /**
     * @brief Pin voltage magnitude above which a component counts as powered.
     */
    double poweredThreshold = 0.1;

    /** @brief Dissipation ceiling (watts) before a part is reported as
     * overheating. */
    double maxSafePower = 0.25;

    /** @brief LED current magnitude (amperes) above which it is lit. */
    double ledActiveCurrent = 0.005;

    /**
     * @brief Dump the assembled MNA matrix and RHS to stdout before solving.
     */
    bool printMatrix = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument if a tolerance or threshold is out of range.
     */
    void validate() const
    {
        if (!(pivotTolerance > 0.0))
            throw std::invalid_argument("pivotTolerance must be > 0");
        if (!(poweredThreshold >= 0.0))
            throw std::invalid_argument("poweredThreshold must be >= 0");
        if (!(maxSafePower > 0.0))
            throw std::invalid_argument("maxSafePower must be > 0");
        if (!(ledActiveCurrent >= 0.0))
            throw std::invalid_argument("ledActiveCurrent must be >= 0");
    }
};
