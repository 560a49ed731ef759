#include <gtest/gtest.h>

#include "Circuit.hpp"
#include "Ground.hpp"
#include "Led.hpp"
#include "Resistor.hpp"
#include "Switch.hpp"
#include "UnmodeledElement.hpp"
#include "VoltageSource.hpp"

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

/*
 * element_factory_test.cpp
 *
 * Unit tests for CircuitElement::create(...), CircuitElement::kindFromName(...)
 * and the Circuit container.
 */

TEST(ElementFactory, BuildsModeledKinds)
{
  auto src = CircuitElement::create("source", "n1", "9V Battery", "9V", 1, 2);
  ASSERT_NE(std::dynamic_pointer_cast<VoltageSource>(src), nullptr);
  EXPECT_EQ(src->getKind(), ComponentKind::Source);
  EXPECT_EQ(src->getId(), "n1");
  EXPECT_EQ(src->getLabel(), "9V Battery");
  EXPECT_EQ(src->getValue(), "9V");
  EXPECT_DOUBLE_EQ(src->getX(), 1.0);
  EXPECT_DOUBLE_EQ(src->getY(), 2.0);

  EXPECT_NE(std::dynamic_pointer_cast<Ground>(
                CircuitElement::create("ground", "g", "GND", "", 0, 0)),
            nullptr);
  EXPECT_NE(std::dynamic_pointer_cast<Resistor>(
                CircuitElement::create("resistor", "r", "R", "1k", 0, 0)),
            nullptr);
  EXPECT_NE(std::dynamic_pointer_cast<Led>(
                CircuitElement::create("led", "d", "D", "Red", 0, 0)),
            nullptr);
  EXPECT_NE(std::dynamic_pointer_cast<Switch>(
                CircuitElement::create("switch", "s", "S", "open", 0, 0)),
            nullptr);
}

TEST(ElementFactory, KindTagIsCaseInsensitiveButPreserved)
{
  EXPECT_EQ(CircuitElement::kindFromName("LED"), ComponentKind::Led);
  EXPECT_EQ(CircuitElement::kindFromName("Resistor"), ComponentKind::Resistor);
  EXPECT_EQ(CircuitElement::kindFromName("SWITCH"), ComponentKind::Switch);

  auto led = CircuitElement::create("LED", "d1", "LED1", "Red", 0, 0);
  EXPECT_EQ(led->getKind(), ComponentKind::Led);
  EXPECT_EQ(led->getKindName(), "LED");
}

TEST(ElementFactory, UnknownTagsAreUnmodeled)
{
  for (const std::string& tag :
       {"ic", "transistor", "capacitor", "diode", ""}) {
    auto el = CircuitElement::create(tag, "x1", "X", "100uF", 0, 0);
    ASSERT_NE(std::dynamic_pointer_cast<UnmodeledElement>(el), nullptr);
    EXPECT_EQ(el->getKind(), ComponentKind::Unmodeled);
    EXPECT_EQ(el->getKindName(), tag);
    EXPECT_FALSE(el->needsBranchCurrent());
  }
}

TEST(ElementFactory, UnmodeledAndGroundStampNothing)
{
  std::vector<std::vector<double>> mna(2, std::vector<double>(2, 0.0));
  std::vector<double> rhs(2, 0.0);
  StampIndices idx;
  idx.p1 = 0;
  idx.p2 = 1;

  auto ic = CircuitElement::create("ic", "u1", "U1", "555", 0, 0);
  auto gnd = CircuitElement::create("ground", "g1", "GND", "", 0, 0);
  ic->stamp(mna, rhs, idx);
  gnd->stamp(mna, rhs, idx);

  for (const auto& row : mna)
    for (double v : row) EXPECT_DOUBLE_EQ(v, 0.0);
  EXPECT_DOUBLE_EQ(rhs[0], 0.0);
  EXPECT_DOUBLE_EQ(rhs[1], 0.0);

  Eigen::VectorXd x = Eigen::VectorXd::Ones(2);
  EXPECT_DOUBLE_EQ(ic->computeCurrent(5.0, 0.0, x, idx), 0.0);
}

TEST(ComponentKindOutput, LowercaseNames)
{
  std::ostringstream os;
  os << ComponentKind::Source << " " << ComponentKind::Led << " "
     << ComponentKind::Unmodeled;
  EXPECT_EQ(os.str(), "source led unmodeled");
}

TEST(CircuitContainer, LookupAndOrder)
{
  Circuit circuit;
  EXPECT_TRUE(circuit.empty());
  EXPECT_TRUE(circuit.addComponent(
      CircuitElement::create("source", "b1", "B1", "9V", 0, 0)));
  EXPECT_TRUE(circuit.addComponent(
      CircuitElement::create("resistor", "r1", "R1", "1k", 0, 0)));
  EXPECT_TRUE(circuit.addComponent(
      CircuitElement::create("source", "b2", "B2", "5", 0, 0)));
  circuit.addWire("w1", "b1", "r1");

  EXPECT_FALSE(circuit.empty());
  EXPECT_EQ(circuit.indexOf("b1"), 0);
  EXPECT_EQ(circuit.indexOf("r1"), 1);
  EXPECT_EQ(circuit.indexOf("zz"), -1);
  EXPECT_EQ(circuit.voltageSourceCount(), 2);
  ASSERT_NE(circuit.findComponent("r1"), nullptr);
  EXPECT_EQ(circuit.findComponent("r1")->getLabel(), "R1");
  EXPECT_EQ(circuit.findComponent("zz"), nullptr);
  ASSERT_EQ(circuit.wires().size(), 1u);
  EXPECT_EQ(circuit.wires()[0].targetId, "r1");
}

TEST(CircuitContainer, RejectsDuplicateAndNull)
{
  Circuit circuit;
  ASSERT_TRUE(circuit.addComponent(
      CircuitElement::create("resistor", "r1", "R1", "1k", 0, 0)));

  testing::internal::CaptureStderr();
  EXPECT_FALSE(circuit.addComponent(
      CircuitElement::create("led", "r1", "LED", "Red", 0, 0)));
  EXPECT_FALSE(circuit.addComponent(nullptr));
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(circuit.components().size(), 1u);
  EXPECT_EQ(circuit.components()[0]->getKind(), ComponentKind::Resistor);
  EXPECT_NE(err.find("Duplicate component id 'r1'"), std::string::npos);
}
