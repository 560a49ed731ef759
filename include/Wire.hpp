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
 * @file Wire.hpp
 * @brief Undirected connection between two components on the board.
 *
 * A wire names two component ids. Which pin of each component it attaches to
 * is not stored; the net resolver infers it from the component kinds and from
 * which end of the wire the component sits on (`sourceId` vs `targetId`).
 * Duplicate wires between the same pair are allowed.
 */

#pragma once

#include <string>

/**
 * @class Wire
 * @brief Represents a connection between two components.
 */
class Wire
{
   public:
    /** @brief Unique wire identifier (diagnostics only). */
    std::string id;

    /**
     * @brief Id of the component the wire was drawn from.
     */
    std::string sourceId;

    /**
     * @brief Id of the component the wire was drawn to.
     */
    std::string targetId;
};
