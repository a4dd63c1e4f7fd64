/**
 * @file proto_assembly.cpp
 * @brief Prototype tests for interface detection, the assembly graph and
 *        chain generation.
 *
 * Test cases:
 * 1. World transform of points, directions and box corners
 * 2. Two cubes sharing a face: face_to_face, both parts junctions
 * 3. Cylindrical pairs: pin_in_hole and shaft_in_bore classification
 * 4. Rotated neighbor: detection through the part transform
 * 5. Graph build and A-B-C path, disconnected D
 * 6. Path tie-break and junction queries
 * 7. Assembly bounds from transformed corners
 * 8. Chain generation from an assembly and from a path
 */

#include "core/assembly/AssemblyGraph.h"
#include "core/assembly/AssemblyGraphBuilder.h"
#include "core/assembly/ChainGenerator.h"
#include "core/assembly/InterfaceDetector.h"
#include "core/assembly/WorldTransform.h"
#include "core/tolerance/StackupCalculator.h"

#include <QCoreApplication>

#include <array>
#include <cassert>
#include <cmath>
#include <iostream>
#include <numbers>
#include <set>
#include <string>
#include <vector>

using namespace stackcad::core;
using namespace stackcad::core::assembly;

namespace {

bool nearlyEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

Transform translation(double x, double y, double z) {
    Transform m = identityTransform();
    m[12] = x;
    m[13] = y;
    m[14] = z;
    return m;
}

// Rotation about +Z, column-major, followed by a translation
Transform rotationZ(double degrees, double x, double y, double z) {
    const double a = degrees * std::numbers::pi / 180.0;
    Transform m = translation(x, y, z);
    m[0] = std::cos(a);
    m[1] = std::sin(a);
    m[4] = -std::sin(a);
    m[5] = std::cos(a);
    return m;
}

PartFace planarFace(int id, Vec3d center, Vec3d normal, double area) {
    PartFace face;
    face.id = id;
    face.faceType = FaceType::Planar;
    face.center = center;
    face.normal = normal;
    face.area = area;
    return face;
}

PartFace cylindricalFace(int id, Vec3d center, double radius) {
    PartFace face;
    face.id = id;
    face.faceType = FaceType::Cylindrical;
    face.center = center;
    face.normal = {1.0, 0.0, 0.0};
    face.radius = radius;
    face.axis = Vec3d{0.0, 0.0, 1.0};
    face.area = 2.0 * std::numbers::pi * radius * 10.0;
    return face;
}

// Faces: 1 +X, 2 -X, 3 +Y, 4 -Y, 5 +Z, 6 -Z
AssemblyPart makeCube(const std::string& id, double size, const Transform& transform) {
    const double h = size / 2.0;
    const double area = size * size;

    AssemblyPart part;
    part.id = id;
    part.name = id;
    part.transform = transform;
    part.boundingBox = BoundingBox{{0.0, 0.0, 0.0}, {size, size, size}};
    part.faces = {
        planarFace(1, {size, h, h}, {1.0, 0.0, 0.0}, area),
        planarFace(2, {0.0, h, h}, {-1.0, 0.0, 0.0}, area),
        planarFace(3, {h, size, h}, {0.0, 1.0, 0.0}, area),
        planarFace(4, {h, 0.0, h}, {0.0, -1.0, 0.0}, area),
        planarFace(5, {h, h, size}, {0.0, 0.0, 1.0}, area),
        planarFace(6, {h, h, 0.0}, {0.0, 0.0, -1.0}, area),
    };
    return part;
}

MatingInterface makeInterface(const std::string& id, const std::string& a, const std::string& b) {
    MatingInterface iface;
    iface.id = id;
    iface.partA = {a, a + "-face-1"};
    iface.partB = {b, b + "-face-2"};
    iface.interfaceType = InterfaceType::FaceToFace;
    iface.proximity = 0.02;
    iface.defaultTolerance = 0.05;
    return iface;
}

void testWorldTransform() {
    std::cout << "Test 1: World transform of points, directions and corners..." << std::flush;

    const WorldTransform rotated(rotationZ(90.0, 20.0, 0.0, 0.0));

    const gp_Pnt p = rotated.applyToPoint({1.0, 0.0, 0.0});
    assert(nearlyEqual(p.X(), 20.0) && nearlyEqual(p.Y(), 1.0) && nearlyEqual(p.Z(), 0.0));

    // Directions ignore the translation
    const gp_XYZ d = rotated.applyToDirection({0.0, 1.0, 0.0});
    assert(nearlyEqual(d.X(), -1.0) && nearlyEqual(d.Y(), 0.0));

    Transform scaled = identityTransform();
    scaled[0] = 3.0;
    scaled[5] = 0.5;
    const gp_XYZ n = WorldTransform(scaled).applyToDirection({1.0, 1.0, 0.0});
    assert(nearlyEqual(n.Modulus(), 1.0));
    assert(nearlyEqual(n.X() / n.Y(), 6.0));

    const auto corners = WorldTransform(translation(1.0, 2.0, 3.0))
                             .applyToBoxCorners(BoundingBox{{0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}});
    assert(nearlyEqual(corners[0].X(), 1.0) && nearlyEqual(corners[0].Y(), 2.0));
    assert(nearlyEqual(corners[7].X(), 2.0) && nearlyEqual(corners[7].Y(), 3.0)
           && nearlyEqual(corners[7].Z(), 4.0));

    std::cout << " PASS\n";
}

void testCoincidentCubesFaceToFace() {
    std::cout << "Test 2: Two cubes sharing a face classify face_to_face..." << std::flush;

    const std::vector<AssemblyPart> parts = {
        makeCube("A", 10.0, identityTransform()),
        makeCube("B", 10.0, translation(10.0, 0.0, 0.0)),
    };

    const InterfaceDetector detector;
    const auto detection = detector.detect(parts);

    // Three opposing face pairs per axis direction, all within the pre-filter bound
    assert(detection.interfaces.size() == 6);
    for (const auto& iface : detection.interfaces) {
        assert(iface.interfaceType == InterfaceType::FaceToFace);
        assert(nearlyEqual(iface.normalAlignment, 1.0));
        assert(nearlyEqual(iface.contactArea, 10.0));
        assert(iface.isJunction);
    }

    const MatingInterface& best = detection.interfaces.front();
    assert(best.id == "interface-0");
    assert(best.partA.partId == "A" && best.partA.faceId == "A-face-1");
    assert(best.partB.partId == "B" && best.partB.faceId == "B-face-2");
    assert(nearlyEqual(best.proximity, 0.0));
    assert(nearlyEqual(best.contactPoint.x, 10.0) && nearlyEqual(best.contactPoint.y, 5.0));
    assert(nearlyEqual(best.defaultTolerance, 0.05));

    // Farthest opposing pair (A -X against B +X) ranks last
    assert(nearlyEqual(detection.interfaces.back().proximity, 20.0));
    assert(detection.interfaces[5].id == "interface-5");

    assert((detection.junctionParts == std::vector<std::string>{"A", "B"}));

    DetectionParams single;
    single.maxInterfacesPerPair = 1;
    const auto top = InterfaceDetector(single).detect(parts);
    assert(top.interfaces.size() == 1);
    assert(top.junctionParts.empty());
    assert(!top.interfaces.front().isJunction);

    // Beyond max(2 * 50, half diagonals) nothing is considered
    const std::vector<AssemblyPart> apart = {
        makeCube("A", 10.0, identityTransform()),
        makeCube("B", 10.0, translation(500.0, 0.0, 0.0)),
    };
    assert(detector.detect(apart).interfaces.empty());

    std::cout << " PASS\n";
}

void testCylindricalClassification() {
    std::cout << "Test 3: Cylindrical pairs classify pin_in_hole / shaft_in_bore..." << std::flush;

    const InterfaceDetector detector;
    assert(detector.classify(FaceType::Cylindrical, FaceType::Cylindrical, 0.2, 5.0, 5.3)
           == InterfaceType::PinInHole);
    assert(detector.classify(FaceType::Cylindrical, FaceType::Cylindrical, 0.2, 5.0, 6.0)
           == InterfaceType::Unknown);
    assert(detector.classify(FaceType::Cylindrical, FaceType::Planar, -1.0, 5.0, std::nullopt)
           == InterfaceType::ShaftInBore);
    assert(detector.classify(FaceType::Planar, FaceType::Planar, -0.85, std::nullopt, std::nullopt)
           == InterfaceType::Unknown);
    assert(detector.classify(FaceType::Planar, FaceType::Planar, -0.95, std::nullopt, std::nullopt)
           == InterfaceType::FaceToFace);

    AssemblyPart pin;
    pin.id = "pin";
    pin.name = "Pin";
    pin.faces = {cylindricalFace(1, {0.0, 0.0, 0.0}, 5.0)};

    AssemblyPart bore;
    bore.id = "bore";
    bore.name = "Bore";
    bore.transform = translation(0.0, 0.0, 1.0);
    bore.faces = {cylindricalFace(1, {0.0, 0.0, 0.0}, 5.2),
                  planarFace(2, {0.0, 0.0, 5.0}, {0.0, 0.0, 1.0}, 40.0)};

    const auto detection = detector.detect({pin, bore});
    assert(detection.interfaces.size() == 1);

    const MatingInterface& fit = detection.interfaces.front();
    assert(fit.interfaceType == InterfaceType::PinInHole);
    assert(nearlyEqual(fit.contactArea, std::numbers::pi * 25.0));
    assert(nearlyEqual(fit.proximity, 1.0));
    assert(nearlyEqual(fit.defaultTolerance, 0.025));
    assert(fit.partB.faceId == "bore-face-1");
    assert(detection.junctionParts.empty());

    DetectionParams strict;
    strict.minContactArea = 100.0;
    assert(InterfaceDetector(strict).detect({pin, bore}).interfaces.empty());

    std::cout << " PASS\n";
}

void testRotatedNeighbor() {
    std::cout << "Test 4: Detection follows the part transform..." << std::flush;

    // B turned 90 degrees: its +Y face now faces -X and touches A's +X face
    const std::vector<AssemblyPart> parts = {
        makeCube("A", 10.0, identityTransform()),
        makeCube("B", 10.0, rotationZ(90.0, 20.0, 0.0, 0.0)),
    };

    const auto detection = InterfaceDetector().detect(parts);
    assert(!detection.interfaces.empty());

    const MatingInterface& best = detection.interfaces.front();
    assert(best.partA.faceId == "A-face-1");
    assert(best.partB.faceId == "B-face-3");
    assert(nearlyEqual(best.proximity, 0.0, 1e-9));

    DetectionParams threaded;
    threaded.workerCount = 3;
    const std::vector<AssemblyPart> four = {
        makeCube("A", 10.0, identityTransform()),
        makeCube("B", 10.0, translation(10.0, 0.0, 0.0)),
        makeCube("C", 10.0, translation(20.0, 0.0, 0.0)),
        makeCube("D", 10.0, translation(0.0, 10.0, 0.0)),
    };
    const auto sequential = InterfaceDetector().detect(four);
    const auto parallel = InterfaceDetector(threaded).detect(four);
    assert(sequential.interfaces.size() == parallel.interfaces.size());
    for (size_t i = 0; i < sequential.interfaces.size(); ++i) {
        assert(sequential.interfaces[i].id == parallel.interfaces[i].id);
        assert(sequential.interfaces[i].partA.faceId == parallel.interfaces[i].partA.faceId);
        assert(sequential.interfaces[i].partB.faceId == parallel.interfaces[i].partB.faceId);
    }
    assert(sequential.junctionParts == parallel.junctionParts);

    std::cout << " PASS\n";
}

void testGraphBuildAndPath() {
    std::cout << "Test 5: Graph build, A-B-C path and disconnected D..." << std::flush;

    std::vector<AssemblyPart> parts;
    for (const char* id : {"A", "B", "C", "D"}) {
        AssemblyPart part;
        part.id = id;
        part.name = std::string("Part ") + id;
        part.faces = {planarFace(1, {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, 1.0)};
        parts.push_back(part);
    }
    const std::vector<MatingInterface> interfaces = {
        makeInterface("i-ab", "A", "B"),
        makeInterface("i-bc", "B", "C"),
        makeInterface("i-ab-2", "B", "A"),
    };

    const AssemblyGraph graph = AssemblyGraphBuilder::build(parts, interfaces);
    assert(graph.partCount() == 4);
    assert(graph.interfaceCount() == 3);
    assert(graph.isAdjacencySymmetric());

    // Second A-B interface does not duplicate the neighbor entry
    assert((graph.adjacentParts("A") == std::vector<std::string>{"B"}));
    assert((graph.adjacentParts("B") == std::vector<std::string>{"A", "C"}));
    assert(graph.adjacentParts("D").empty());
    assert(graph.adjacentParts("unknown").empty());

    const AssemblyPart* a = graph.getPart("A");
    assert(a && a->boundingBox && a->color);
    assert(a->faces.front().globalId == "A-face-1");
    assert(graph.getPart("B")->color != a->color);

    const auto path = AssemblyGraphBuilder::findPath(graph, "A", "C");
    assert(path);
    assert((path->parts == std::vector<std::string>{"A", "B", "C"}));
    assert((path->interfaces == std::vector<std::string>{"i-ab", "i-bc"}));

    const auto reverse = AssemblyGraphBuilder::findPath(graph, "C", "A");
    assert(reverse && (reverse->interfaces == std::vector<std::string>{"i-bc", "i-ab"}));

    assert(!AssemblyGraphBuilder::findPath(graph, "A", "D"));

    const auto self = AssemblyGraphBuilder::findPath(graph, "A", "A");
    assert(self && self->parts.size() == 1 && self->interfaces.empty());

    std::cout << " PASS\n";
}

void testPathTieBreakAndJunctions() {
    std::cout << "Test 6: Path tie-break and junction queries..." << std::flush;

    std::vector<AssemblyPart> parts;
    for (const char* id : {"A", "B", "C", "D"}) {
        AssemblyPart part;
        part.id = id;
        part.name = id;
        parts.push_back(part);
    }

    // Diamond: A-B, A-C, B-D, C-D. Both routes to D have two hops.
    const AssemblyGraph graph = AssemblyGraphBuilder::build(parts, {
        makeInterface("i-ab", "A", "B"),
        makeInterface("i-ac", "A", "C"),
        makeInterface("i-bd", "B", "D"),
        makeInterface("i-cd", "C", "D"),
    });

    const auto path = AssemblyGraphBuilder::findPath(graph, "A", "D");
    assert(path);
    assert((path->parts == std::vector<std::string>{"A", "B", "D"}));
    assert((path->interfaces == std::vector<std::string>{"i-ab", "i-bd"}));

    const MatingInterface* between = AssemblyGraphBuilder::findInterfaceBetween(graph, "D", "C");
    assert(between && between->id == "i-cd");
    assert(!AssemblyGraphBuilder::findInterfaceBetween(graph, "A", "D"));

    assert(AssemblyGraphBuilder::getPartInterfaces(graph, "A").size() == 2);
    assert(AssemblyGraphBuilder::isJunctionPart(graph, "A"));
    assert(AssemblyGraphBuilder::getJunctionParts(graph).size() == 4);

    const auto colors = AssemblyGraphBuilder::generatePartColors(8);
    std::set<std::array<double, 3>> distinct(colors.begin(), colors.end());
    assert(distinct.size() == 8);
    for (const auto& color : colors) {
        for (double channel : color) {
            assert(channel >= 0.0 && channel <= 1.0);
        }
    }

    std::cout << " PASS\n";
}

void testAssemblyBounds() {
    std::cout << "Test 7: Assembly bounds from transformed corners..." << std::flush;

    const BoundingBox empty = AssemblyGraphBuilder::calculateAssemblyBounds({});
    assert(empty.min.x == 0.0 && empty.max.x == 1.0 && empty.max.z == 1.0);

    const BoundingBox twoCubes = AssemblyGraphBuilder::calculateAssemblyBounds({
        makeCube("A", 10.0, identityTransform()),
        makeCube("B", 10.0, rotationZ(90.0, 20.0, 0.0, 0.0)),
    });
    assert(nearlyEqual(twoCubes.min.x, 0.0) && nearlyEqual(twoCubes.max.x, 20.0));
    assert(nearlyEqual(twoCubes.max.y, 10.0) && nearlyEqual(twoCubes.max.z, 10.0));

    // A box turned 45 degrees is wider than its transformed min/max corners alone
    const BoundingBox turned = AssemblyGraphBuilder::calculateAssemblyBounds({
        makeCube("T", 10.0, rotationZ(45.0, 0.0, 0.0, 0.0)),
    });
    const double half = 10.0 / std::sqrt(2.0);
    assert(nearlyEqual(turned.min.x, -half, 1e-7) && nearlyEqual(turned.max.x, half, 1e-7));
    assert(nearlyEqual(turned.min.y, 0.0, 1e-7) && nearlyEqual(turned.max.y, 2.0 * half, 1e-7));

    AssemblyPart boxless;
    boxless.id = "X";
    boxless.transform = translation(5.0, 5.0, 5.0);
    const BoundingBox unit = AssemblyGraphBuilder::calculateAssemblyBounds({boxless});
    assert(nearlyEqual(unit.min.x, 5.0) && nearlyEqual(unit.max.x, 6.0));

    std::cout << " PASS\n";
}

void testChainGeneration() {
    std::cout << "Test 8: Chain generation from assembly and from a path..." << std::flush;

    AssemblyPart a = makeCube("A", 20.0, identityTransform());
    a.name = "Housing";
    AssemblyPart b;
    b.id = "B";
    b.name = "Spacer";
    AssemblyPart c = makeCube("C", 10.0, translation(40.0, 0.0, 0.0));
    c.name = "Cover";

    std::vector<MatingInterface> interfaces = {
        makeInterface("i-0", "A", "B"),
        makeInterface("i-1", "B", "C"),
        makeInterface("i-2", "A", "C"),
        makeInterface("i-3", "A", "C"),
        makeInterface("i-4", "B", "C"),
    };
    interfaces[0].interfaceType = InterfaceType::Unknown;
    interfaces[1].proximity = 0.0;

    const auto chain = ChainGenerator::generateFromAssembly("chain-auto", {a, b, c}, interfaces);
    assert(chain.links.size() == 6);
    assert(chain.isComplete);
    assert(chain.direction[0] == 1.0 && chain.direction[1] == 0.0);

    assert(chain.links[0].name == "Housing Length");
    assert(nearlyEqual(chain.links[0].nominal, 20.0));
    assert(nearlyEqual(chain.links[0].plusTolerance, 0.02));
    assert(chain.links[0].direction == tolerance::ContributionDirection::Positive);
    assert(nearlyEqual(chain.links[1].nominal, 50.0));
    assert(chain.links[1].direction == tolerance::ContributionDirection::Negative);
    assert(chain.links[2].direction == tolerance::ContributionDirection::Positive);

    // Unknown i-0 is skipped; i-1 has no measured gap
    assert(chain.links[3].type == tolerance::LinkType::InterfaceGap);
    assert(chain.links[3].interfaceId == "i-1");
    assert(nearlyEqual(chain.links[3].nominal, 0.05));
    assert(chain.links[3].name == "Interface Gap 1");
    assert(chain.links[5].interfaceId == "i-3");

    const auto single = ChainGenerator::generateFromAssembly("chain-one", {b}, {});
    assert(single.links.size() == 1 && !single.isComplete);

    const AssemblyGraph graph = AssemblyGraphBuilder::build({a, b, c}, {
        makeInterface("i-ab", "A", "B"),
        makeInterface("i-bc", "B", "C"),
    });
    const auto path = AssemblyGraphBuilder::findPath(graph, "A", "C");
    assert(path);

    const auto pathChain = ChainGenerator::generateFromPath("chain-path", graph, *path);
    assert(pathChain.links.size() == 5);
    assert(pathChain.links[0].partId == "A");
    assert(pathChain.links[1].interfaceId == "i-ab");
    assert(pathChain.links[2].partId == "B");
    assert(pathChain.links[3].interfaceId == "i-bc");
    assert(pathChain.links[4].partId == "C");
    assert(nearlyEqual(pathChain.links[1].nominal, 0.02));
    assert(pathChain.startDatum && pathChain.startDatum->faceId == "A-face-1");
    assert(pathChain.endDatum && pathChain.endDatum->partId == "C"
           && pathChain.endDatum->faceId == "C-face-2");

    tolerance::CalculationOptions options;
    options.monteCarloSamples = 1000;
    options.seed = 5;
    tolerance::StackupCalculator calculator;
    const auto outcome = calculator.calculate(pathChain.links, options);
    assert(outcome.success);
    // The graph gave the box-less spacer a unit box
    assert(nearlyEqual(outcome.result.totalNominal, 20.0 + 0.02 + 1.0 + 0.02 + 10.0, 1e-9));

    std::cout << " PASS\n";
}

void testChainFromGraphParts() {
    std::cout << "Test 9: Assembly chain from graph parts keeps its result..." << std::flush;

    AssemblyPart a = makeCube("A", 20.0, identityTransform());
    AssemblyPart b;
    b.id = "B";
    b.name = "Spacer";
    AssemblyPart c = makeCube("C", 10.0, translation(40.0, 0.0, 0.0));
    const std::vector<MatingInterface> interfaces = {
        makeInterface("i-ab", "A", "B"),
        makeInterface("i-bc", "B", "C"),
    };

    AssemblyGraph graph = AssemblyGraphBuilder::build({c, a, b}, interfaces);
    const std::vector<AssemblyPart> parts = graph.parts();
    assert(parts.size() == 3);
    assert(parts[0].id == "C" && parts[1].id == "A" && parts[2].id == "B");
    assert(parts[2].boundingBox);

    // The box-less spacer measures as the unit box, not the fallback length
    auto chain = ChainGenerator::generateFromAssembly("chain-auto", parts, interfaces);
    assert(chain.links[2].partId == "B");
    assert(nearlyEqual(chain.links[2].nominal, 1.0));
    const auto raw = ChainGenerator::generateFromAssembly("chain-raw", {c, a, b}, interfaces);
    assert(nearlyEqual(raw.links[2].nominal, ChainGeneratorConfig{}.fallbackPartLength));

    tolerance::CalculationOptions options;
    options.runMonteCarlo = false;
    tolerance::StackupCalculator calculator;
    const auto outcome = calculator.calculate(chain.links, options);
    assert(outcome.success);
    chain.result = outcome.result;
    chain.isCalculated = true;
    graph.setChain(chain);

    const auto* stored = graph.getChain("chain-auto");
    assert(stored && stored->isCalculated && stored->result);
    assert(nearlyEqual(stored->result->totalNominal, outcome.result.totalNominal));

    std::cout << " PASS\n";
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    std::cout << "\n=== Assembly Prototype Tests ===\n\n";

    testWorldTransform();
    testCoincidentCubesFaceToFace();
    testCylindricalClassification();
    testRotatedNeighbor();
    testGraphBuildAndPath();
    testPathTieBreakAndJunctions();
    testAssemblyBounds();
    testChainGeneration();
    testChainFromGraphParts();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
