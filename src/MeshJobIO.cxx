#include "MeshJobIO.hxx"
#include "MeshErrors.hxx"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear(); std::istringstream iss(line); std::string t; while (iss >> t) out.push_back(t);
}

static void expectCount(const std::vector<std::string>& toks, std::size_t n) {
    if (toks.size() != n + 1) {
        throw std::runtime_error("Key '" + toks[0] + "' expects " + std::to_string(n) + " value(s)");
    }
}

// Whole-token conversions: trailing characters such as "1abc" are rejected
static double toDouble(const std::string& tok) {
    std::size_t used = 0;
    const double v = std::stod(tok, &used);
    if (used != tok.size()) throw std::invalid_argument(tok);
    return v;
}

static int toInt(const std::string& tok) {
    std::size_t used = 0;
    const int v = std::stoi(tok, &used);
    if (used != tok.size()) throw std::invalid_argument(tok);
    return v;
}

static double number(const std::vector<std::string>& toks) {
    expectCount(toks, 1);
    return toDouble(toks[1]);
}

static void writeList(std::ofstream& ofs, const char* key, const std::vector<double>& v) {
    if (v.empty()) return;
    ofs << key;
    for (double x : v) ofs << ' ' << x;
    ofs << '\n';
}
}

namespace MeshJobIO {

MeshKind parseKind(const std::string& token) {
    if (token == "rectangle") return MeshKind::Rectangle;
    if (token == "annulus") return MeshKind::Annulus;
    if (token == "frustum") return MeshKind::Frustum;
    if (token == "cylinder") return MeshKind::Cylinder;
    throw InvalidTokenError("Invalid mesh kind '" + token + "'");
}

const char* toString(MeshKind kind) {
    switch (kind) {
        case MeshKind::Rectangle: return "rectangle";
        case MeshKind::Annulus: return "annulus";
        case MeshKind::Frustum: return "frustum";
        case MeshKind::Cylinder: return "cylinder";
    }
    throw InvalidTokenError("Invalid mesh kind");
}

bool readFile(const std::string& path, MeshJob& out, std::string* errorMessage) {
    try {
        std::ifstream ifs(path);
        if (!ifs) throw std::runtime_error("Could not open mesh job file for reading");
        MeshJob job;
        bool haveKind = false;
        std::string line; std::vector<std::string> toks;
        int lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;
            auto hashPos = line.find('#'); if (hashPos != std::string::npos) line = line.substr(0, hashPos);
            std::string t = trim(line); if (t.empty() || t[0] == '*') continue;
            splitTokens(t, toks); if (toks.empty()) continue;
            const std::string& key = toks[0];
            try {
                if (key == "mesh") { expectCount(toks, 1); job.kind = parseKind(toks[1]); haveKind = true; }
                else if (key == "mesh_size") job.meshSize = number(toks);
                else if (key == "width") job.width = number(toks);
                else if (key == "height") job.height = number(toks);
                else if (key == "outer_radius" || key == "large_radius") job.outerRadius = number(toks);
                else if (key == "inner_radius" || key == "small_radius") job.innerRadius = number(toks);
                else if (key == "radius") job.radius = number(toks);
                else if (key == "num_quads") { expectCount(toks, 1); job.numQuads = toInt(toks[1]); }
                else if (key == "thickness") job.params.material.t = number(toks);
                else if (key == "modulus") job.params.material.E = number(toks);
                else if (key == "poisson") job.params.material.nu = number(toks);
                else if (key == "kx_mod") job.params.material.kxMod = number(toks);
                else if (key == "ky_mod") job.params.material.kyMod = number(toks);
                else if (key == "first_node") { expectCount(toks, 1); NameSeq::parse(toks[1]); job.params.firstNode = toks[1]; }
                else if (key == "first_element") { expectCount(toks, 1); NameSeq::parse(toks[1]); job.params.firstElement = toks[1]; }
                else if (key == "origin") {
                    expectCount(toks, 3);
                    job.origin = { toDouble(toks[1]), toDouble(toks[2]), toDouble(toks[3]) };
                }
                else if (key == "plane") { expectCount(toks, 1); job.plane = CoordMap::parsePlane(toks[1]); }
                else if (key == "axis") { expectCount(toks, 1); job.axis = CoordMap::parseAxis(toks[1]); }
                else if (key == "element_type") { expectCount(toks, 1); job.elementType = Mesh::parseElementType(toks[1]); }
                else if (key == "x_control") { for (std::size_t i = 1; i < toks.size(); ++i) job.xControl.push_back(toDouble(toks[i])); }
                else if (key == "y_control") { for (std::size_t i = 1; i < toks.size(); ++i) job.yControl.push_back(toDouble(toks[i])); }
                else if (key == "opening") {
                    expectCount(toks, 5);
                    job.openings.push_back(RectOpening{ toks[1], toDouble(toks[2]), toDouble(toks[3]),
                                                        toDouble(toks[4]), toDouble(toks[5]) });
                }
                else if (key == "end") break;
                else throw std::runtime_error("Unknown key '" + key + "'");
            } catch (const std::invalid_argument&) {
                throw std::runtime_error("line " + std::to_string(lineNo) + ": bad number for '" + key + "'");
            } catch (const std::exception& e) {
                throw std::runtime_error("line " + std::to_string(lineNo) + ": " + e.what());
            }
        }
        if (!haveKind) throw std::runtime_error("Mesh job has no 'mesh' line");
        out = std::move(job);
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeFile(const std::string& path, const MeshJob& job, std::string* errorMessage) {
    try {
        std::ofstream ofs(path);
        if (!ofs) throw std::runtime_error("Could not open mesh job file for writing");
        ofs << std::setprecision(17);
        ofs << "* PlateMesh job v1\n";
        ofs << "mesh " << toString(job.kind) << "\n";
        ofs << "mesh_size " << job.meshSize << "\n";
        switch (job.kind) {
            case MeshKind::Rectangle:
                ofs << "width " << job.width << "\n" << "height " << job.height << "\n";
                ofs << "plane " << CoordMap::toString(job.plane) << "\n";
                ofs << "element_type " << Mesh::toString(job.elementType) << "\n";
                writeList(ofs, "x_control", job.xControl);
                writeList(ofs, "y_control", job.yControl);
                for (const auto& o : job.openings) {
                    ofs << "opening " << o.name << ' ' << o.xLeft << ' ' << o.yBottom
                        << ' ' << o.width << ' ' << o.height << "\n";
                }
                break;
            case MeshKind::Annulus:
                ofs << "outer_radius " << job.outerRadius << "\n" << "inner_radius " << job.innerRadius << "\n";
                ofs << "axis " << CoordMap::toString(job.axis) << "\n";
                break;
            case MeshKind::Frustum:
                ofs << "large_radius " << job.outerRadius << "\n" << "small_radius " << job.innerRadius << "\n";
                ofs << "height " << job.height << "\n";
                ofs << "axis " << CoordMap::toString(job.axis) << "\n";
                break;
            case MeshKind::Cylinder:
                ofs << "radius " << job.radius << "\n" << "height " << job.height << "\n";
                if (job.numQuads > 0) ofs << "num_quads " << job.numQuads << "\n";
                ofs << "axis " << CoordMap::toString(job.axis) << "\n";
                ofs << "element_type " << Mesh::toString(job.elementType) << "\n";
                break;
        }
        const Material& m = job.params.material;
        ofs << "thickness " << m.t << "\nmodulus " << m.E << "\npoisson " << m.nu << "\n";
        ofs << "kx_mod " << m.kxMod << "\nky_mod " << m.kyMod << "\n";
        ofs << "first_node " << job.params.firstNode << "\n";
        ofs << "first_element " << job.params.firstElement << "\n";
        ofs << "origin " << job.origin[0] << ' ' << job.origin[1] << ' ' << job.origin[2] << "\n";
        ofs << "end\n";
        if (!ofs) throw std::runtime_error("Failed writing mesh job file");
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

Mesh generate(const MeshJob& job, SweepInfo* info) {
    switch (job.kind) {
        case MeshKind::Rectangle: {
            RectangleMesher mesher(job.meshSize, job.width, job.height, job.params,
                                   job.origin, job.plane, job.elementType);
            for (double x : job.xControl) mesher.addXControl(x);
            for (double y : job.yControl) mesher.addYControl(y);
            for (const auto& o : job.openings) mesher.addRectOpening(o.name, o.xLeft, o.yBottom, o.width, o.height);
            return mesher.generate();
        }
        case MeshKind::Annulus:
            return SweepMesher::annulus(job.meshSize, job.outerRadius, job.innerRadius,
                                        job.params, job.origin, job.axis, info);
        case MeshKind::Frustum:
            return SweepMesher::frustum(job.meshSize, job.outerRadius, job.innerRadius, job.height,
                                        job.params, job.origin, job.axis, info);
        case MeshKind::Cylinder:
            return SweepMesher::cylinder(job.meshSize, job.radius, job.height, job.params,
                                         job.origin, job.axis, job.numQuads, job.elementType, info);
    }
    throw InvalidTokenError("Invalid mesh kind");
}

} // namespace MeshJobIO
