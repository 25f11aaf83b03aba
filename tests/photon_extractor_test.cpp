// filename: photon_extractor_test.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/child_builder.hpp"
#include "oceanparse/extractors.hpp"
#include "oceanparse/types.hpp"

#include <cmath>
#include <iostream>

int main() {
    using namespace oceanparse;

    const PhotonData dipole = extractPhoton("dipole\ncartesian 1 0 0\nend\ncartesian 0 1 0\nend\n4966\n");
    if (!dipole.operatorType || *dipole.operatorType != "dipole") {
        std::cerr << "dipole operator not recognised\n";
        return 1;
    }
    if (dipole.vectors.size() != 2 || dipole.vectors[0][0] != 1.0 || dipole.vectors[1][1] != 1.0) {
        std::cerr << "Expected two cartesian vectors, got " << dipole.vectors.size() << "\n";
        return 1;
    }
    if (!dipole.energy || *dipole.energy != 4966.0) {
        std::cerr << "Photon energy after 'end' not extracted\n";
        return 1;
    }

    Method dipoleMethod{};
    populatePhoton(dipoleMethod, "dipole\ncartesian 1 0 0\nend\n4966\n");
    if (!dipoleMethod.photon || dipoleMethod.photon->momentumTransfer.has_value()) {
        std::cerr << "dipole must not carry a momentum transfer\n";
        return 1;
    }
    if (!dipoleMethod.photon->energy ||
        std::abs(*dipoleMethod.photon->energy - 4966.0 * ELECTRON_VOLT) > 1e-25) {
        std::cerr << "Photon energy was not converted to J\n";
        return 1;
    }

    // Second vector present but the operator is dipole: still no momentum transfer.
    Method dipoleTwoVectors{};
    populatePhoton(dipoleTwoVectors, "dipole\ncartesian 1 0 0\nend\ncartesian 0 1 0\nend\n4966\n");
    if (dipoleTwoVectors.photon->momentumTransfer.has_value()) {
        std::cerr << "dipole with two vectors must leave momentum transfer unset\n";
        return 1;
    }

    Method quadSingle{};
    populatePhoton(quadSingle, "quad\ncartesian 0 0 1\nend\n4966.5\n");
    if (!quadSingle.photon || !quadSingle.photon->multipoleType ||
        *quadSingle.photon->multipoleType != "quad") {
        std::cerr << "quad operator not recognised\n";
        return 1;
    }
    if (!quadSingle.photon->polarization || (*quadSingle.photon->polarization)[2] != 1.0) {
        std::cerr << "quad polarization vector missing\n";
        return 1;
    }
    if (quadSingle.photon->momentumTransfer.has_value()) {
        std::cerr << "quad with a single vector must leave momentum transfer unset\n";
        return 1;
    }

    Method nrixs{};
    populatePhoton(nrixs, "NRIXS\ncartesian 1 0 0\nend\ncartesian 0.5 0.5 0\nend\n6000\n");
    if (!nrixs.photon->momentumTransfer || (*nrixs.photon->momentumTransfer)[0] != 0.5) {
        std::cerr << "NRIXS second vector must become the momentum transfer\n";
        return 1;
    }

    const PhotonData garbage = extractPhoton("garbage\ncartesian 1 x\n");
    if (garbage.operatorType || !garbage.vectors.empty() || garbage.energy) {
        std::cerr << "Malformed photon text must yield empty fields\n";
        return 1;
    }

    std::cout << "Photon extraction verified successfully\n";
    return 0;
}
