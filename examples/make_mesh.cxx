#include "MeshJobIO.hxx"
#include "MshIO.hxx"
#include "MeshErrors.hxx"

#include <cstdio>
#include <string>

static std::string replaceExt(const std::string& path, const std::string& newExt) {
    auto slash = path.find_last_of('/');
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos || (slash != std::string::npos && pos < slash)) return path + newExt;
    return path.substr(0, pos) + newExt;
}

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::fprintf(stderr, "Usage: %s <job file> [out.msh]\n", argv[0]);
        return 2;
    }
    const std::string jobPath = argv[1];
    const std::string mshPath = (argc >= 3) ? argv[2] : replaceExt(jobPath, ".msh");

    MeshJob job;
    std::string err;
    if (!MeshJobIO::readFile(jobPath, job, &err)) {
        std::fprintf(stderr, "Failed to read mesh job %s: %s\n", jobPath.c_str(), err.c_str());
        return 1;
    }

    Mesh M;
    SweepInfo info;
    try {
        M = MeshJobIO::generate(job, &info);
    } catch (const MeshError& e) {
        std::fprintf(stderr, "Mesh generation failed: %s\n", e.what());
        return 1;
    }

    if (M.elements.empty()) {
        std::fprintf(stderr, "Mesh generation failed: the openings remove every element\n");
        return 1;
    }

    std::printf("Generated %s mesh: %d nodes (%s..%s), %d elements (%s..%s)\n",
                MeshJobIO::toString(job.kind),
                M.numNodes(), M.nodes.begin()->get()->name.c_str(), M.lastNode()->name.c_str(),
                M.numElements(), M.elements.begin()->get()->name.c_str(), M.lastElement()->name.c_str());
    if (info.rings > 0) {
        std::printf("Rings: %d (%d transitions), sectors %d inner / %d outer\n",
                    info.rings, info.transitions, info.innerQuads, info.outerQuads);
    }

    if (!MshIO::writeFile(mshPath, M, MeshJobIO::toString(job.kind), &err)) {
        std::fprintf(stderr, "Failed to write %s: %s\n", mshPath.c_str(), err.c_str());
        return 1;
    }
    std::printf("Wrote mesh: %s\n", mshPath.c_str());
    return 0;
}
