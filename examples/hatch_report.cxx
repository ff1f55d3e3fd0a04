#include "HatchBuilder.hxx"
#include "SectionProperties.hxx"

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<BulgeVertex> rectPath(double x0, double y0, double w, double h) {
	return { {x0, y0, 0.0}, {x0 + w, y0, 0.0}, {x0 + w, y0 + h, 0.0}, {x0, y0 + h, 0.0} };
}

// Two vertices with bulge 1: a full circle through (cx - r, cy) and (cx + r, cy)
static std::vector<BulgeVertex> circlePath(double cx, double cy, double r) {
	return { {cx - r, cy, 1.0}, {cx + r, cy, 1.0} };
}

static void printPolygons(const HatchResult& r) {
	for (std::size_t i = 0; i < r.polygons.size(); ++i) {
		const Polygon& P = r.polygons[i];
		std::printf("  polygon %zu: %zu outer points, %zu hole(s), area %.4f\n",
		            i, P.outer.size(), P.holes.size(), P.area());
	}
}

int main(int argc, char** argv) {
	// Optional pixel size in drawing units, as a viewer would pass it
	double pixelSize = 0.5;
	if (argc > 1) {
		try {
			pixelSize = std::stod(argv[1]);
		} catch (const std::exception&) {
			std::fprintf(stderr, "usage: %s [pixel-size]\n", argv[0]);
			return 1;
		}
	}

	try {
		// Plate 100 x 60 with a rounded slot cut-out and two bolt holes
		std::vector<BulgeVertex> slot{ {30.0, 25.0, 0.0}, {70.0, 25.0, 1.0}, {70.0, 35.0, 0.0}, {30.0, 35.0, 1.0} };

		HatchDefinition plate;
		plate.boundaryPaths.push_back(rectPath(0.0, 0.0, 100.0, 60.0));
		plate.boundaryPaths.push_back(slot);
		plate.boundaryPaths.push_back(circlePath(12.0, 12.0, 4.0));
		plate.boundaryPaths.push_back(circlePath(88.0, 48.0, 4.0));
		plate.style = HoleStyle::Normal;
		plate.patternName = "ANSI31";
		PatternLine ansi31;
		ansi31.angle = 45.0;
		ansi31.offset = {-2.24506, 2.24506};
		plate.patternLines.push_back(ansi31);
		plate.pixelSize = pixelSize;

		HatchBuilder builder;
		HatchResult pattern = builder.build(plate);
		std::printf("ANSI31 plate: %zu stroke(s)\n", pattern.strokes.size());
		printPolygons(pattern);

		plate.patternName = "SOLID";
		HatchResult solid = builder.build(plate);
		std::printf("SOLID plate: %zu stroke(s)\n", solid.strokes.size());
		printPolygons(solid);

		// Same profile as extrusion section: outer boundary plus three mandrels
		SectionProperties props;
		SectionStats s = props.compute({ rectPath(0.0, 0.0, 100.0, 60.0), slot,
		                                 circlePath(12.0, 12.0, 4.0), circlePath(88.0, 48.0, 4.0) });
		std::printf("Section: net area %.3f mm2, outer perimeter %.3f mm, total perimeter %.3f mm\n",
		            s.netArea, s.outerPerimeter, s.totalPerimeter);
		std::printf("         mandrels %d, circumscribing diameter %.3f mm\n", s.mandrelCount, s.diameter());
	} catch (const std::exception& e) {
		std::fprintf(stderr, "hatch_report failed: %s\n", e.what());
		return 1;
	}
	return 0;
}
