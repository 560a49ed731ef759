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
 * @file NetResolver.cpp
 * @brief Union-find based pin inference and net merging.
 *
 * Pin ids are allocated two per component, in circuit order, so the same
 * circuit always produces the same representatives. The ground net is
 * decided only after all wires have been applied.
 */

#include "NetResolver.hpp"

#include <iostream>

int DisjointSet::makeSet()
{
    int id = static_cast<int>(parent.size());
    parent.push_back(id);
    return id;
}

int DisjointSet::find(int i)
{
    int root = i;
    while (parent[root] != root) root = parent[root];

    // Path compression
    while (parent[i] != root) {
        int next = parent[i];
        parent[i] = root;
        i = next;
    }
    return root;
}

void DisjointSet::unite(int i, int j)
{
    int rootI = find(i);
    int rootJ = find(j);
    if (rootI != rootJ) parent[rootI] = rootJ;
}

int selectWirePin(const CircuitElement& element, const PinNets& pins,
                  WireEnd end)
{
    // Incoming side of every component
    if (end == WireEnd::Target) return pins.p1;

    switch (element.getKind()) {
        case ComponentKind::Source:  // positive terminal
        case ComponentKind::Ground:
            return pins.p1;
        case ComponentKind::Resistor:
        case ComponentKind::Led:
        case ComponentKind::Switch:
        case ComponentKind::Unmodeled:
            return pins.p2;
    }
    return pins.p2;
}

NetMap resolveNets(const Circuit& circuit)
{
    DisjointSet forest;
    std::map<std::string, PinNets> pinIds;

    // 1) Two fresh pins per component; ground pins are shorted.
    for (const auto& element : circuit.components()) {
        PinNets pins;
        pins.p1 = forest.makeSet();
        pins.p2 = forest.makeSet();
        if (element->getKind() == ComponentKind::Ground)
            forest.unite(pins.p1, pins.p2);
        pinIds[element->getId()] = pins;
    }

    // 2) Wires merge the selected pins of their endpoints.
    for (const Wire& wire : circuit.wires()) {
        auto source = circuit.findComponent(wire.sourceId);
        auto target = circuit.findComponent(wire.targetId);
        if (!source || !target) {
            std::cerr << "Warning: Wire '" << wire.id
                      << "' references unknown component '"
                      << (!source ? wire.sourceId : wire.targetId)
                      << "', ignoring it" << std::endl;
            continue;
        }

        int sourcePin =
            selectWirePin(*source, pinIds[wire.sourceId], WireEnd::Source);
        int targetPin =
            selectWirePin(*target, pinIds[wire.targetId], WireEnd::Target);
        forest.unite(sourcePin, targetPin);
    }

    // 3) Ground reference: all ground components merged.
    int groundNet = NO_NET;
    for (const auto& element : circuit.components()) {
        if (element->getKind() != ComponentKind::Ground) continue;
        int net = forest.find(pinIds[element->getId()].p1);
        if (groundNet == NO_NET)
            groundNet = net;
        else
            forest.unite(groundNet, net);
        groundNet = forest.find(groundNet);
    }

    // 4) Implicit return path: wires never reach a source's negative
    //    terminal, so every source's p2 sits on the reference net.
    for (const auto& element : circuit.components()) {
        if (element->getKind() != ComponentKind::Source) continue;
        int negative = forest.find(pinIds[element->getId()].p2);
        if (groundNet == NO_NET)
            groundNet = negative;
        else
            forest.unite(groundNet, negative);
        groundNet = forest.find(groundNet);
    }

    NetMap result;
    result.groundNet = groundNet;
    for (const auto& p : pinIds) {
        PinNets resolved;
        resolved.p1 = forest.find(p.second.p1);
        resolved.p2 = forest.find(p.second.p2);
        result.pinOf[p.first] = resolved;
    }
    return result;
}
