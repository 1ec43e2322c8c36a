/// Basic usage example for porephase
/// Demonstrates building a two-component mixture and reading blended properties

#include <porephase/PorePhase.hpp>
#include <iostream>

int main() {
    // Network with 5 pores and 8 throats
    PorePhase::Project project({5, 8});

    // Pure component phases
    auto water = project.createPhase("water");
    auto air = project.createPhase("air");
    water->set("pore.viscosity", 1.0e-3);
    air->set("pore.viscosity", 1.8e-5);
    water->set("pore.molar_mass", 0.018);
    air->set("pore.molar_mass", 0.029);

    // Mixture echoing its warnings to stderr
    PorePhase::MixtureSettings settings;
    settings.lEchoDiagnostics = true;
    auto humid = project.createMixture("humid_air", {water, air}, settings);

    try {
        // Specify water content, let air fill the rest
        humid->setMoleFraction("water", 0.02);
        humid->recomputeFromFreeComponent();

        PorePhase::HealthReport health = humid->checkHealth();
        if (!health.isHealthy()) {
            std::cerr << "Composition does not sum to unity in "
                      << health.tooLow.size() + health.tooHigh.size() + health.unspecified.size()
                      << " pores\n";
            return 1;
        }

        Eigen::VectorXd mu = humid->get("pore.viscosity");
        Eigen::VectorXd mw = humid->get("pore.molar_mass");
        std::cout << "Mixture viscosity in pore 0:  " << mu(0) << " Pa.s\n";
        std::cout << "Mixture molar mass in pore 0: " << mw(0) << " kg/mol\n";

        // Switch to concentrations as the source of truth
        humid->setConcentration("water", 0.9);
        humid->setConcentration("air", 40.0);
        humid->recomputeFromConcentrations();
        std::cout << "Water mole fraction from concentrations: "
                  << humid->get("pore.mole_fraction.water")(0) << "\n";
    }
    catch (const PorePhase::MixtureException& e) {
        std::cerr << "Error (code " << e.code() << "): " << e.what() << std::endl;
        return 1;
    }

    humid->printSummary(std::cout);
    return 0;
}
