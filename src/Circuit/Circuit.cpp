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
 * @file Circuit.cpp
 * @brief Component and wire bookkeeping for a board.
 */

#include "Circuit.hpp"

#include <iostream>
#include <utility>

bool Circuit::addComponent(std::shared_ptr<CircuitElement> element)
{
    if (!element) {
        std::cerr << "Error: Cannot add a null component" << std::endl;
        return false;
    }

    const std::string id = element->getId();
    if (indexById.count(id) != 0) {
        std::cerr << "Error: Duplicate component id '" << id << "'"
                  << std::endl;
        return false;
    }

    indexById[id] = static_cast<int>(elements.size());
    elements.push_back(std::move(element));
    return true;
}

void Circuit::addWire(const std::string& id, const std::string& sourceId,
                      const std::string& targetId)
{
    Wire wire;
    wire.id = id;
    wire.sourceId = sourceId;
    wire.targetId = targetId;
    connections.push_back(wire);
}

std::shared_ptr<const CircuitElement> Circuit::findComponent(
    const std::string& id) const
{
    int index = indexOf(id);
    if (index < 0) return nullptr;
    return elements[index];
}

int Circuit::indexOf(const std::string& id) const
{
    auto it = indexById.find(id);
    if (it == indexById.end()) return -1;
    return it->second;
}

int Circuit::voltageSourceCount() const
{
    int count = 0;
    for (const auto& element : elements) {
        if (element->getKind() == ComponentKind::Source) ++count;
    }
    return count;
}
