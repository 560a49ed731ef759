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
 * @file main.hpp
 * @brief Entry point of the CircuitMind_Sim command-line tool.
 *
 * `main()` reads the threshold flags into an `AnalysisOptions`, rejects
 * values that `AnalysisOptions::validate()` refuses, and hands the board file
 * (default `circuit.board`) to `runSolver()`. Exit status is 0 on success and
 * 1 for a bad option or a board that failed to parse.
 *
 * @code
 *   ./CircuitMind_Sim boards/led_driver.board
 *   ./CircuitMind_Sim --max-safe-power 0.5 --print-matrix boards/switch_light.board
 * @endcode
 */

#pragma once
