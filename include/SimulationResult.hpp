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
 * @file SimulationResult.hpp
 * @brief Read-only snapshot of one DC analysis.
 *
 * A result is built once by the extractor and never changed afterwards.
 * Every component of the analysed circuit has an entry in the voltage,
 * current and power maps; the powered set holds the ids of sources and of
 * components with a pin above the powered threshold.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>

class SimulationResult
{
   public:
    SimulationResult() = default;

    SimulationResult(std::map<std::string, double> voltages,
                     std::map<std::string, double> currents,
                     std::map<std::string, double> powers,
                     std::set<std::string> powered)
        : nodeVoltages(std::move(voltages)),
          componentCurrents(std::move(currents)),
          componentPower(std::move(powers)),
          poweredIds(std::move(powered))
    {
    }

    /** @brief Voltage of each component's p1 net, keyed by component id. */
    const std::map<std::string, double>& voltages() const
    {
        return nodeVoltages;
    }
    /** @brief Signed current through each component. */
    const std::map<std::string, double>& currents() const
    {
        return componentCurrents;
    }
    /** @brief Non-negative dissipated (or delivered) power. */
    const std::map<std::string, double>& powers() const
    {
        return componentPower;
    }
    const std::set<std::string>& poweredSet() const { return poweredIds; }

    // Per-id lookups; unknown ids read as 0 / not powered.
    double voltage(const std::string& id) const;
    double current(const std::string& id) const;
    double power(const std::string& id) const;
    bool isPowered(const std::string& id) const
    {
        return poweredIds.count(id) != 0;
    }

   private:
    std::map<std::string, double> nodeVoltages;
    std::map<std::string, double> componentCurrents;
    std::map<std::string, double> componentPower;
    std::set<std::string> poweredIds;
};
