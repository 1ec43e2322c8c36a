/// @file test_Composition.cpp
/// @brief Tests for mole fraction / concentration reconciliation and health checks

#include <gtest/gtest.h>
#include "porephase/PorePhase.hpp"
#include <cmath>

using namespace PorePhase;
using Constants::ElementKind;

/// @brief Three-component mixture on a small network
class CompositionTest : public ::testing::Test {
protected:
    void SetUp() override {
        a = project.createPhase("A");
        b = project.createPhase("B");
        c = project.createPhase("C");
        mix = project.createMixture("mix", {a, b, c});
    }

    /// @brief Check every entry of an array against a value
    static void expectAll(const Eigen::VectorXd& values, double expected, double tol = 1e-12) {
        for (Eigen::Index i = 0; i < values.size(); ++i) {
            EXPECT_NEAR(values(i), expected, tol) << "at index " << i;
        }
    }

    Project project{ElementCounts{5, 3}};
    std::shared_ptr<Phase> a;
    std::shared_ptr<Phase> b;
    std::shared_ptr<Phase> c;
    std::shared_ptr<Mixture> mix;
};

TEST_F(CompositionTest, AggregateSumsComponents) {
    mix->setMoleFraction("A", 0.2);
    mix->setMoleFraction("B", 0.3);
    mix->setMoleFraction("C", 0.5);

    mix->recomputeAggregate();
    expectAll(mix->get("pore.mole_fraction.all"), 1.0);
}

TEST_F(CompositionTest, AggregateOfSingleComponent) {
    Project single({2, 2});
    auto only = single.createPhase("only");
    auto solo = single.createMixture("solo", {only});

    solo->setMoleFraction("only", 1.0);
    expectAll(solo->get("pore.mole_fraction.all"), 1.0);
    EXPECT_TRUE(solo->checkHealth().isHealthy());
}

TEST_F(CompositionTest, AggregateOfEmptyMixtureIsZero) {
    auto empty = project.createMixture("empty", {});
    empty->recomputeAggregate();
    expectAll(empty->get("pore.mole_fraction.all"), 0.0);
}

/// @brief A = 0.3, B = 0.5, C unset -> C = 0.2
TEST_F(CompositionTest, FreeComponentIsBackSolved) {
    mix->setMoleFraction("A", 0.3);
    mix->setMoleFraction("B", 0.5);

    mix->recomputeFromFreeComponent();

    expectAll(mix->get("pore.mole_fraction.C"), 0.2);
    expectAll(mix->get("pore.mole_fraction.all"), 1.0);
    EXPECT_TRUE(mix->checkHealth().isHealthy());
}

TEST_F(CompositionTest, ReleasedComponentIsBackSolved) {
    mix->setMoleFraction("A", 0.3);
    mix->setMoleFraction("B", 0.3);
    mix->setMoleFraction("C", 0.3);

    mix->recomputeFromFreeComponent(*b);

    expectAll(mix->get("pore.mole_fraction.A"), 0.3);
    expectAll(mix->get("pore.mole_fraction.B"), 0.4);
    expectAll(mix->get("pore.mole_fraction.C"), 0.3);
}

TEST_F(CompositionTest, ReleasedComponentMustBelongToMixture) {
    auto d = project.createPhase("D");
    EXPECT_THROW(mix->recomputeFromFreeComponent(*d), NotInMixtureError);
    EXPECT_THROW(mix->recomputeFromFreeComponent("E"), NotInProjectError);
}

TEST_F(CompositionTest, FreeSolveFallsBackToConcentrations) {
    mix->setConcentration("A", 1.0);
    mix->setConcentration("B", 1.0);
    mix->setConcentration("C", 2.0);

    // Every mole fraction is unset, so there is no single free component
    mix->recomputeFromFreeComponent();

    expectAll(mix->get("pore.mole_fraction.A"), 0.25);
    expectAll(mix->get("pore.mole_fraction.B"), 0.25);
    expectAll(mix->get("pore.mole_fraction.C"), 0.5);
    EXPECT_EQ(mix->diagnostics().countCode(ErrorCode::kConcentrationFallback), 1);
}

TEST_F(CompositionTest, FreeSolveFallbackWithoutConcentrations) {
    mix->setMoleFraction("A", 0.5);
    EXPECT_THROW(mix->recomputeFromFreeComponent(), InsufficientConcentrationDataError);
}

/// @brief Concentrations [2, 3] -> mole fractions [0.4, 0.6]
TEST_F(CompositionTest, ConcentrationNormalization) {
    Project binary({4, 2});
    auto n2 = binary.createPhase("N2");
    auto o2 = binary.createPhase("O2");
    auto gas = binary.createMixture("gas", {n2, o2});

    gas->setConcentration("N2", 2.0);
    gas->setConcentration(*o2, 3.0);
    gas->recomputeFromConcentrations();

    expectAll(gas->get("pore.mole_fraction.N2"), 0.4);
    expectAll(gas->get("pore.mole_fraction.O2"), 0.6);
    expectAll(gas->get("pore.mole_fraction.all"), 1.0);
}

TEST_F(CompositionTest, ConcentrationNormalizationPerInstance) {
    Eigen::VectorXd ca(5), cb(5);
    ca << 1.0, 2.0, 3.0, 4.0, 0.0;
    cb << 3.0, 2.0, 1.0, 0.0, 5.0;
    mix->setConcentration("A", ca);
    mix->setConcentration("B", cb);
    mix->setConcentration("C", 0.0);

    mix->recomputeFromConcentrations();

    Eigen::VectorXd xa = mix->get("pore.mole_fraction.A");
    EXPECT_DOUBLE_EQ(xa(0), 0.25);
    EXPECT_DOUBLE_EQ(xa(1), 0.5);
    EXPECT_DOUBLE_EQ(xa(3), 1.0);
    EXPECT_DOUBLE_EQ(xa(4), 0.0);
}

TEST_F(CompositionTest, ConcentrationNormalizationRequiresAllComponents) {
    mix->setConcentration("A", 1.0);
    mix->setConcentration("B", 1.0);

    try {
        mix->recomputeFromConcentrations();
        FAIL() << "Expected InsufficientConcentrationDataError";
    }
    catch (const InsufficientConcentrationDataError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInsufficientConcentrationData);
    }
}

TEST_F(CompositionTest, SetConcentrationUnsetsMoleFractions) {
    mix->setMoleFraction("A", 0.2);
    mix->setMoleFraction("B", 0.3);
    mix->setMoleFraction("C", 0.5);

    mix->setConcentration("A", 4.0);

    EXPECT_TRUE(mix->get("pore.mole_fraction.A").hasNaN());
    EXPECT_TRUE(mix->get("pore.mole_fraction.B").hasNaN());
    EXPECT_TRUE(mix->get("pore.mole_fraction.C").hasNaN());
    expectAll(mix->get("pore.concentration.A"), 4.0);
}

TEST_F(CompositionTest, EmptyConcentrationIsIgnored) {
    mix->setMoleFraction("A", 1.0);
    mix->setConcentration("A", Eigen::VectorXd());

    EXPECT_FALSE(mix->has("pore.concentration.A"));
    expectAll(mix->get("pore.mole_fraction.A"), 1.0);
}

TEST_F(CompositionTest, SetMoleFractionLeavesOthersUntouched) {
    mix->setConcentration("B", 7.0);
    mix->setMoleFraction("C", 0.1);

    mix->setMoleFraction("A", 0.6);

    expectAll(mix->get("pore.concentration.B"), 7.0);
    expectAll(mix->get("pore.mole_fraction.C"), 0.1);
    EXPECT_TRUE(mix->get("pore.mole_fraction.B").hasNaN());
}

TEST_F(CompositionTest, OutOfRangeMoleFractionWarns) {
    auto findings = mix->setMoleFraction("A", 1.5);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].severity, Severity::Warning);
    EXPECT_EQ(findings[0].code, ErrorCode::kMoleFractionOutOfRange);
    EXPECT_EQ(findings[0].key, "pore.mole_fraction.A");
    EXPECT_TRUE(mix->diagnostics().hasWarnings());

    // Stored anyway
    expectAll(mix->get("pore.mole_fraction.A"), 1.5);

    EXPECT_TRUE(mix->setMoleFraction("B", 0.5).empty());
    EXPECT_FALSE(mix->setMoleFraction("C", -0.1).empty());
    EXPECT_EQ(mix->diagnostics().countCode(ErrorCode::kMoleFractionOutOfRange), 2);
}

TEST_F(CompositionTest, MembershipIsValidated) {
    auto d = project.createPhase("D");
    Phase stranger("E", {5, 3});

    EXPECT_THROW(mix->setMoleFraction(*d, 0.5), NotInMixtureError);
    EXPECT_THROW(mix->setMoleFraction(stranger, 0.5), NotInProjectError);
    EXPECT_THROW(mix->setConcentration("D", 1.0), NotInMixtureError);
    EXPECT_THROW(mix->setConcentration("E", 1.0), NotInProjectError);
}

TEST_F(CompositionTest, LengthIsValidated) {
    EXPECT_THROW(mix->setMoleFraction("A", Eigen::VectorXd::Constant(4, 0.5)), ArrayLengthMismatchError);
}

/// @brief Two components at 0.6 each are over-specified everywhere
TEST_F(CompositionTest, HealthReportsTooHigh) {
    Project binary({4, 2});
    auto x = binary.createPhase("x");
    auto y = binary.createPhase("y");
    auto m = binary.createMixture("m", {x, y});
    m->setMoleFraction("x", 0.6);
    m->setMoleFraction("y", 0.6);

    HealthReport report = m->checkHealth();

    EXPECT_FALSE(report.isHealthy());
    EXPECT_TRUE(report.tooLow.empty());
    ASSERT_EQ(report.tooHigh.size(), 4u);
    for (Eigen::Index i = 0; i < 4; ++i) {
        EXPECT_EQ(report.tooHigh[static_cast<std::size_t>(i)], i);
    }
}

TEST_F(CompositionTest, HealthReportsLowAndUnspecified) {
    Eigen::VectorXd xa(5);
    xa << 0.2, 0.2, 0.2, 0.2, 0.2;
    Eigen::VectorXd xb(5);
    xb << 0.8, 0.7, 0.9, 0.8, 0.8;
    Eigen::VectorXd xc = Eigen::VectorXd::Zero(5);
    xc(4) = Constants::kUnset;

    mix->setMoleFraction("A", xa);
    mix->setMoleFraction("B", xb);
    mix->setMoleFraction("C", xc);

    HealthReport report = mix->checkHealth();
    ASSERT_EQ(report.tooLow.size(), 1u);
    EXPECT_EQ(report.tooLow[0], 1);
    ASSERT_EQ(report.tooHigh.size(), 1u);
    EXPECT_EQ(report.tooHigh[0], 2);
    ASSERT_EQ(report.unspecified.size(), 1u);
    EXPECT_EQ(report.unspecified[0], 4);
}

TEST_F(CompositionTest, HealthCheckRefreshesStaleAggregate) {
    mix->setMoleFraction("A", 0.5);
    mix->setMoleFraction("B", 0.5);
    mix->setMoleFraction("C", 0.0);
    EXPECT_TRUE(mix->checkHealth().isHealthy());

    // Direct write of a component mole fraction
    mix->set("pore.mole_fraction.C", 0.5);
    EXPECT_EQ(mix->checkHealth().tooHigh.size(), 5u);
}

TEST_F(CompositionTest, ThroatCompositionIsIndependent) {
    mix->setMoleFraction("A", 1.0, ElementKind::Throat);
    mix->setMoleFraction("B", 0.0, ElementKind::Throat);
    mix->setMoleFraction("C", 0.0, ElementKind::Throat);
    a->set("throat.conductance", 2.0);
    b->set("throat.conductance", 5.0);
    c->set("throat.conductance", 9.0);

    EXPECT_TRUE(mix->checkHealth(ElementKind::Throat).isHealthy());
    expectAll(mix->get("throat.conductance"), 2.0);

    // Pore composition is still unset
    EXPECT_FALSE(mix->checkHealth().isHealthy());
}

TEST_F(CompositionTest, UnityToleranceIsConfigurable) {
    MixtureSettings strict;
    strict.tolerances[kTolUnity] = 0.0;
    MixtureSettings loose;
    loose.tolerances[kTolUnity] = 0.2;

    auto s = project.createMixture("strict", {a, b}, strict);
    auto l = project.createMixture("loose", {a, b}, loose);
    s->setMoleFraction("A", 0.45);
    s->setMoleFraction("B", 0.45);
    l->setMoleFraction("A", 0.45);
    l->setMoleFraction("B", 0.45);
    a->set("pore.density", 1.0);
    b->set("pore.density", 3.0);

    EXPECT_THROW(s->get("pore.density"), CompositionNotNormalizedError);
    expectAll(l->get("pore.density"), 1.8);
}
