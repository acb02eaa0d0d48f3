#ifndef PLATEMESH_MESH_ERRORS_HXX
#define PLATEMESH_MESH_ERRORS_HXX

#include <stdexcept>
#include <string>

// Base error for everything the mesh generators throw.
class MeshError : public std::runtime_error {
public:
    explicit MeshError(const std::string& what) : std::runtime_error(what) {}
};

// Unrecognized plane, axis, element type, mesh kind or result direction token.
class InvalidTokenError : public MeshError {
public:
    explicit InvalidTokenError(const std::string& what) : MeshError(what) {}
};

// First node/element name not of the form <letter><positive integer>.
class InvalidNameError : public MeshError {
public:
    explicit InvalidNameError(const std::string& what) : MeshError(what) {}
};

#endif // PLATEMESH_MESH_ERRORS_HXX
