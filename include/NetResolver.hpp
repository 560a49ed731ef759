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
 * @file NetResolver.hpp
 * @brief Pin inference and net merging for board-style circuits.
 *
 * Boards connect whole components rather than individual terminals, so the
 * resolver has to decide which pin of each component a wire touches. It
 * gives every component two fresh pin ids (p1, p2) in a disjoint-set forest
 * and merges pins that wires join:
 *
 *  - A ground component's p1 and p2 are merged immediately.
 *  - For a wire (a -> b): a voltage source or ground at `a` connects through
 *    p1; any other kind at `a` connects through p2 (its outgoing side). The
 *    component at `b` always connects through p1 (its incoming side).
 *  - All ground components are merged into one reference net. Without a
 *    ground, the net under the first voltage source's p2 (negative terminal)
 *    becomes the reference. Without either, there is no reference.
 *  - Wires only ever reach a source's p1, so each source's p2 is tied to the
 *    reference net (the implicit return path of a battery drawn on the
 *    board).
 *
 * The rule is directional and kind-dependent on purpose: saved boards and
 * presets are drawn source -> load -> ground and rely on it.
 *
 * All state lives in the returned NetMap, so separate calls share nothing.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "Circuit.hpp"

/**
 * @brief Net id meaning "no such net" (no ground reference).
 */
constexpr int NO_NET = -1;

/**
 * @class DisjointSet
 * @brief Union-find over a growable array of integer ids.
 */
class DisjointSet
{
   public:
    /**
     * @brief Allocate a new singleton set.
     * @return Id of the new element.
     */
    int makeSet();

    /**
     * @brief Representative of the set containing `i` (with path
     * compression).
     */
    int find(int i);

    /**
     * @brief Merge the sets of `i` and `j`. The representative of `j`'s set
     * becomes the representative of the union.
     */
    void unite(int i, int j);

    int size() const { return static_cast<int>(parent.size()); }

   private:
    std::vector<int> parent;
};

/**
 * @struct PinNets
 * @brief Net representatives under a component's two pins.
 */
struct PinNets
{
    int p1 = NO_NET;
    int p2 = NO_NET;
};

/**
 * @enum WireEnd
 * @brief Which end of a wire a component sits on.
 */
enum class WireEnd
{
    Source, /**< The wire was drawn from this component */
    Target  /**< The wire was drawn to this component */
};

/**
 * @struct NetMap
 * @brief Result of net resolution.
 *
 * `pinOf` maps each component id to the final net representatives of its
 * pins. `groundNet` is the representative of the reference net or NO_NET.
 */
struct NetMap
{
    std::map<std::string, PinNets> pinOf;
    int groundNet = NO_NET;

    bool hasGround() const { return groundNet != NO_NET; }
};

/**
 * @brief Pin id a component exposes at one end of a wire.
 *
 * @param element Component at that wire end.
 * @param pins Pin ids allocated for the component.
 * @param end Whether the component is the wire's source or target.
 * @return `pins.p1` or `pins.p2`.
 */
int selectWirePin(const CircuitElement& element, const PinNets& pins,
                  WireEnd end);

/**
 * @brief Infer pins and merge them into nets for a whole circuit.
 *
 * Wires naming an unknown component are skipped with a warning on stderr.
 * Components that no wire mentions keep two distinct, unconnected nets.
 *
 * @param circuit Components and wires to resolve.
 * @return Net representatives per component plus the ground reference.
 */
NetMap resolveNets(const Circuit& circuit);
