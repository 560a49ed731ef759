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
 * @file Circuit.hpp
 * @brief Ordered collection of components and wires handed to the engine.
 *
 * The circuit is the caller's description of the board. Component order
 * matters: it fixes the order of matrix unknowns, which voltage source is the
 * implicit reference when no ground exists, and the order in which the
 * verdict classifier scans components.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"
#include "Wire.hpp"

class Circuit
{
   public:
    /**
     * @brief Append a component.
     *
     * @param element Element to add (ignored when null).
     * @return false (with a diagnostic on stderr) if the id is already used
     * or the element is null, true otherwise.
     */
    bool addComponent(std::shared_ptr<CircuitElement> element);

    /**
     * @brief Append a wire. Endpoints are not checked here; the net resolver
     * skips wires that name unknown components.
     */
    void addWire(const std::string& id, const std::string& sourceId,
                 const std::string& targetId);

    /**
     * @brief Look up a component by id.
     * @return The element, or nullptr if no component has that id.
     */
    std::shared_ptr<const CircuitElement> findComponent(
        const std::string& id) const;

    /**
     * @brief Position of a component in insertion order, or -1.
     */
    int indexOf(const std::string& id) const;

    const std::vector<std::shared_ptr<CircuitElement>>& components() const
    {
        return elements;
    }
    const std::vector<Wire>& wires() const { return connections; }

    /**
     * @brief Number of voltage-source components (one branch unknown each).
     */
    int voltageSourceCount() const;

    bool empty() const { return elements.empty(); }

   private:
    std::vector<std::shared_ptr<CircuitElement>> elements;
    std::vector<Wire> connections;
    std::map<std::string, int> indexById;
};
