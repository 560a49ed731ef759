#include <gtest/gtest.h>

#include "Verdict.hpp"

#include <map>
#include <set>
#include <sstream>
#include <string>

/*
 * verdict_test.cpp
 *
 * Unit tests for classifyResult(...). Results are built by hand so each
 * rule can be checked in isolation from the solver.
 */

namespace
{
Circuit board()
{
  Circuit circuit;
  circuit.addComponent(CircuitElement::create("source", "b1", "9V", "9V", 0, 0));
  circuit.addComponent(CircuitElement::create("switch", "s1", "SW", "", 0, 0));
  circuit.addComponent(CircuitElement::create("resistor", "r1", "R1", "", 0, 0));
  circuit.addComponent(CircuitElement::create("led", "d1", "LED1", "", 0, 0));
  circuit.addComponent(CircuitElement::create("resistor", "r2", "R2", "", 0, 0));
  circuit.addComponent(CircuitElement::create("led", "d2", "LED2", "", 0, 0));
  circuit.addComponent(CircuitElement::create("ground", "g1", "GND", "", 0, 0));
  return circuit;
}

SimulationResult makeResult(const std::map<std::string, double>& currents,
                            const std::map<std::string, double>& powers)
{
  return SimulationResult({}, currents, powers, {});
}
}  // namespace

TEST(ClassifyResult, NeutralWhenNothingHappens)
{
  Circuit circuit = board();
  Verdict verdict = classifyResult(circuit, SimulationResult());
  EXPECT_EQ(verdict.state, VerdictState::Neutral);
  EXPECT_EQ(verdict.message, "SIMULATING...");
  EXPECT_EQ(verdict.details, "Analyzing current flow...");

  Circuit empty;
  EXPECT_EQ(classifyResult(empty, SimulationResult()).state,
            VerdictState::Neutral);
}

TEST(ClassifyResult, OverheatingResistor)
{
  Circuit circuit = board();
  Verdict verdict =
      classifyResult(circuit, makeResult({}, {{"r1", 0.3}}));
  EXPECT_EQ(verdict.state, VerdictState::Danger);
  EXPECT_EQ(verdict.message, "CIRCUIT FAILURE");
  EXPECT_EQ(verdict.details, "R1 is overheating (300mW)");
}

TEST(ClassifyResult, OverheatingLed)
{
  Circuit circuit = board();
  Verdict verdict = classifyResult(
      circuit, makeResult({{"d1", 0.2}}, {{"d1", 2.0}}));
  EXPECT_EQ(verdict.state, VerdictState::Danger);
  EXPECT_EQ(verdict.details, "LED1 is overheating (2000mW)");
}

TEST(ClassifyResult, SourceSwitchAndGroundNeverOverheat)
{
  Circuit circuit = board();
  Verdict verdict = classifyResult(
      circuit, makeResult({}, {{"b1", 5.0}, {"s1", 5.0}, {"g1", 5.0}}));
  EXPECT_EQ(verdict.state, VerdictState::Neutral);
}

TEST(ClassifyResult, PowerLimitIsExclusive)
{
  Circuit circuit = board();
  EXPECT_EQ(classifyResult(circuit, makeResult({}, {{"r1", 0.25}})).state,
            VerdictState::Neutral);
}

TEST(ClassifyResult, FirstOverheatingPartInCircuitOrder)
{
  Circuit circuit = board();
  Verdict verdict = classifyResult(
      circuit, makeResult({}, {{"r2", 1.0}, {"r1", 0.5}}));
  EXPECT_EQ(verdict.details, "R1 is overheating (500mW)");
}

TEST(ClassifyResult, PowerIsRoundedToMilliwatts)
{
  Circuit circuit = board();
  Verdict verdict =
      classifyResult(circuit, makeResult({}, {{"r2", 0.2676}}));
  EXPECT_EQ(verdict.details, "R2 is overheating (268mW)");
}

TEST(ClassifyResult, ActiveLedEitherDirection)
{
  Circuit circuit = board();
  Verdict verdict = classifyResult(circuit, makeResult({{"d2", 0.006}}, {}));
  EXPECT_EQ(verdict.state, VerdictState::Success);
  EXPECT_EQ(verdict.message, "CIRCUIT FUNCTIONAL");
  EXPECT_EQ(verdict.details, "LED2 is active");

  verdict = classifyResult(circuit, makeResult({{"d1", -0.006}}, {}));
  EXPECT_EQ(verdict.state, VerdictState::Success);
  EXPECT_EQ(verdict.details, "LED1 is active");
}

TEST(ClassifyResult, LedThresholdIsExclusive)
{
  Circuit circuit = board();
  EXPECT_EQ(classifyResult(circuit, makeResult({{"d1", 0.005}}, {})).state,
            VerdictState::Neutral);
  // Current through a resistor does not light anything
  EXPECT_EQ(classifyResult(circuit, makeResult({{"r1", 0.5}}, {})).state,
            VerdictState::Neutral);
}

TEST(ClassifyResult, DangerOutranksSuccess)
{
  Circuit circuit = board();
  Verdict verdict = classifyResult(
      circuit, makeResult({{"d1", 0.02}}, {{"d1", 0.02}, {"r2", 0.4}}));
  EXPECT_EQ(verdict.state, VerdictState::Danger);
  EXPECT_EQ(verdict.details, "R2 is overheating (400mW)");
}

TEST(ClassifyResult, CustomThresholds)
{
  Circuit circuit = board();
  AnalysisOptions options;
  options.maxSafePower = 1.0;
  options.ledActiveCurrent = 0.001;

  Verdict verdict = classifyResult(
      circuit, makeResult({{"d1", 0.002}}, {{"r1", 0.5}}), options);
  EXPECT_EQ(verdict.state, VerdictState::Success);
}

TEST(VerdictStateOutput, StreamsLowercaseName)
{
  std::ostringstream os;
  os << VerdictState::Neutral << "/" << VerdictState::Success << "/"
     << VerdictState::Danger;
  EXPECT_EQ(os.str(), "neutral/success/danger");
}
