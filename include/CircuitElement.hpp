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
 * @file CircuitElement.hpp
 * @brief Defines the CircuitElement base class and the component kind enum
 *
 * This file contains the definition of the CircuitElement base class, which
 * represents one device placed on a circuit board. Every element exposes two
 * implicit pins (p1 and p2); the net resolver decides which electrical net each
 * pin belongs to and the solver hands the resulting matrix indices back to the
 * element through `StampIndices` when stamping.
 */

#pragma once

#include <Eigen/Dense>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/**
 * @enum ComponentKind
 * @brief Closed set of component kinds known to the DC engine.
 *
 * The five modeled kinds each have a concrete class with a stamp. Every other
 * tag supplied by the editor (capacitors, transistors, ICs, logic gates, ...)
 * maps to `Unmodeled` and contributes nothing to the system.
 */
enum class ComponentKind
{
    Source,    /**< Independent DC voltage source (battery) */
    Ground,    /**< Ground reference terminal */
    Resistor,  /**< Linear resistor */
    Led,       /**< Light emitting diode, fixed-resistance approximation */
    Switch,    /**< Two-state switch */
    Unmodeled  /**< Any kind without a stamp */
};

inline std::ostream& operator<<(std::ostream& os, ComponentKind kind)
{
    switch (kind) {
        case ComponentKind::Source:
            os << "source";
            break;
        case ComponentKind::Ground:
            os << "ground";
            break;
        case ComponentKind::Resistor:
            os << "resistor";
            break;
        case ComponentKind::Led:
            os << "led";
            break;
        case ComponentKind::Switch:
            os << "switch";
            break;
        case ComponentKind::Unmodeled:
            os << "unmodeled";
            break;
        default:
            os << "UnknownComponentKind";
            break;
    }
    return os;
}

/**
 * @brief Matrix index used for a pin that sits on the ground net (or for an
 * element without a branch unknown).
 */
constexpr int GROUND_INDEX = -1;

/**
 * @struct StampIndices
 * @brief Matrix positions an element writes to.
 *
 * `p1` and `p2` are the column indices of the nets under the element's pins,
 * or GROUND_INDEX when that pin is on the ground reference. `branch` is the
 * index of the element's own current unknown (voltage sources only).
 */
struct StampIndices
{
    int p1 = GROUND_INDEX;
    int p2 = GROUND_INDEX;
    int branch = GROUND_INDEX;
};

/**
 * @class CircuitElement
 * @brief Base class representing one component on the board.
 *
 * Elements are immutable analysis inputs. Derived classes implement the stamp
 * and current extraction for their kind.
 */
class CircuitElement
{
   protected:
    /**
     * @brief Unique identifier of the component
     */
    std::string id;
    /**
     * @brief Kind tag as supplied by the caller (e.g. "resistor", "ic")
     */
    std::string kindName;
    /**
     * @brief Free-text label shown by the renderer
     */
    std::string label;
    /**
     * @brief Magnitude string (resistance, voltage or switch state)
     */
    std::string value;
    /**
     * @brief Placement coordinates, carried through for the renderer only
     */
    double x = 0.0;
    double y = 0.0;
    /**
     * @brief Kind of the element (enum)
     */
    ComponentKind kind = ComponentKind::Unmodeled;

   public:
    /**
     * @brief Construct a CircuitElement
     * @param id Unique component identifier
     * @param label Display label
     * @param value Magnitude string (may be empty)
     * @param x Horizontal placement
     * @param y Vertical placement
     */
    CircuitElement(const std::string& id, const std::string& label,
                   const std::string& value, double x, double y)
        : id(id), label(label), value(value), x(x), y(y)
    {
    }

    /**
     * @brief Virtual destructor
     */
    virtual ~CircuitElement() = default;

    /**
     * @brief Stamps the element's contribution into the MNA matrix and RHS
     * vector
     * @param mna Modified Nodal Analysis matrix
     * @param rhs Right-hand side vector
     * @param indices Matrix indices of the element's pins and branch unknown
     */
    virtual void stamp(std::vector<std::vector<double>>& mna,
                       std::vector<double>& rhs,
                       const StampIndices& indices) const = 0;

    /**
     * @brief Current through the element for a solved system.
     *
     * @param v1 Voltage of the net under p1
     * @param v2 Voltage of the net under p2
     * @param x Solution vector
     * @param indices Matrix indices used when the element was stamped
     * @return Signed current in amperes. Default: 0.
     */
    virtual double computeCurrent(
        [[maybe_unused]] double v1, [[maybe_unused]] double v2,
        [[maybe_unused]] const Eigen::Ref<const Eigen::VectorXd>& x,
        [[maybe_unused]] const StampIndices& indices) const
    {
        return 0.0;
    }

    /**
     * @brief True if the element needs its own branch-current unknown.
     */
    virtual bool needsBranchCurrent() const { return false; }

    /**
     * @brief Creates the concrete element for a kind tag
     * @param kindName Kind tag, matched case-insensitively
     * @param id Unique component identifier
     * @param label Display label
     * @param value Magnitude string
     * @param x Horizontal placement
     * @param y Vertical placement
     * @return Shared pointer to the created element (never null; unknown tags
     * yield an UnmodeledElement)
     */
    static std::shared_ptr<CircuitElement> create(const std::string& kindName,
                                                  const std::string& id,
                                                  const std::string& label,
                                                  const std::string& value,
                                                  double x, double y);

    /**
     * @brief Maps a kind tag to its ComponentKind
     * @param kindName Kind tag, matched case-insensitively
     * @return Matching kind, or ComponentKind::Unmodeled
     */
    static ComponentKind kindFromName(const std::string& kindName);

    std::string getId() const { return id; }
    std::string getKindName() const { return kindName; }
    std::string getLabel() const { return label; }
    std::string getValue() const { return value; }
    double getX() const { return x; }
    double getY() const { return y; }

    /**
     * @brief Gets the component kind
     * @return ComponentKind enum value
     */
    ComponentKind getKind() const { return kind; }
};
