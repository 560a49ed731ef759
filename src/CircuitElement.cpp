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
 * @file CircuitElement.cpp
 * @brief Kind lookup and element factory.
 *
 * `CircuitElement::create` is the only place that maps editor kind tags to
 * concrete element classes. The switch over ComponentKind is exhaustive, so a
 * new modeled kind cannot be added without deciding how it is built here.
 */

#include "CircuitElement.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

#include "Ground.hpp"
#include "Led.hpp"
#include "Resistor.hpp"
#include "Switch.hpp"
#include "UnmodeledElement.hpp"
#include "VoltageSource.hpp"

ComponentKind CircuitElement::kindFromName(const std::string& kindName)
{
    static const std::map<std::string, ComponentKind> kindMap = {
        {"source", ComponentKind::Source},
        {"ground", ComponentKind::Ground},
        {"resistor", ComponentKind::Resistor},
        {"led", ComponentKind::Led},
        {"switch", ComponentKind::Switch}};

    std::string lowered = kindName;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    auto it = kindMap.find(lowered);
    if (it == kindMap.end()) return ComponentKind::Unmodeled;
    return it->second;
}

std::shared_ptr<CircuitElement> CircuitElement::create(
    const std::string& kindName, const std::string& id,
    const std::string& label, const std::string& value, double x, double y)
{
    std::shared_ptr<CircuitElement> element;

    switch (kindFromName(kindName)) {
        case ComponentKind::Source:
            element = std::make_shared<VoltageSource>(id, label, value, x, y);
            break;
        case ComponentKind::Ground:
            element = std::make_shared<Ground>(id, label, value, x, y);
            break;
        case ComponentKind::Resistor:
            element = std::make_shared<Resistor>(id, label, value, x, y);
            break;
        case ComponentKind::Led:
            element = std::make_shared<Led>(id, label, value, x, y);
            break;
        case ComponentKind::Switch:
            element = std::make_shared<Switch>(id, label, value, x, y);
            break;
        case ComponentKind::Unmodeled:
            element = std::make_shared<UnmodeledElement>(id, kindName, label,
                                                         value, x, y);
            break;
    }

    // Keep the tag exactly as the caller spelled it.
    element->kindName = kindName;
    return element;
}
