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
 * @file SimulationResult.cpp
 * @brief Per-id lookups on a result snapshot.
 */

#include "SimulationResult.hpp"

namespace
{
double lookup(const std::map<std::string, double>& values,
              const std::string& id)
{
    auto it = values.find(id);
    return it == values.end() ? 0.0 : it->second;
}
}  // namespace

double SimulationResult::voltage(const std::string& id) const
{
    return lookup(nodeVoltages, id);
}

double SimulationResult::current(const std::string& id) const
{
    return lookup(componentCurrents, id);
}

double SimulationResult::power(const std::string& id) const
{
    return lookup(componentPower, id);
}
