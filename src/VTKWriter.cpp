#include "VTKWriter.hpp"
#include "PolarMesh.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Kilonova {

/// Ensure the parent directory of a file path exists, creating it if needed.
static void ensureParentDir(const std::string& filepath) {
    auto parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

static const char* cellFields[][2] = {
    {"Density",  "1"},
    {"Pressure", "1"},
    {"Velocity", "3"},
    {"Scalar",   "1"},
};

void VTKWriter::writeVTS(const std::string& filename,
                         const BlockGeometry& g,
                         const std::vector<PrimitiveState>& primitives,
                         const std::array<int,6>& pieceExtent,
                         long blockId)
{
    const int nr = g.nr(), nq = g.nq();

    ensureParentDir(filename);
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("VTKWriter::writeVTS: cannot open " + filename);
    }

    file << std::setprecision(15);

    const auto& e = pieceExtent;
    file << "<?xml version=\"1.0\"?>\n";
    file << "<VTKFile type=\"StructuredGrid\" version=\"1.0\" byte_order=\"LittleEndian\">\n";
    file << "  <StructuredGrid WholeExtent=\""
         << e[0] << " " << e[1] << " " << e[2] << " " << e[3] << " " << e[4] << " " << e[5] << "\">\n";
    file << "    <Piece Extent=\""
         << e[0] << " " << e[1] << " " << e[2] << " " << e[3] << " " << e[4] << " " << e[5] << "\">\n";

    // Points, radial index fastest
    file << "      <Points>\n";
    file << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (int j = 0; j <= nq; ++j) {
        double q = g.faceQ(j);
        file << "         ";
        for (int i = 0; i <= nr; ++i) {
            double r = g.faceR(i);
            file << " " << r * std::sin(q) << " 0 " << r * std::cos(q);
        }
        file << "\n";
    }
    file << "        </DataArray>\n";
    file << "      </Points>\n";

    file << "      <CellData>\n";

    // Helper lambda: write a scalar field
    auto writeScalar = [&](const std::string& name, double PrimitiveState::*field) {
        file << "        <DataArray type=\"Float64\" Name=\"" << name
             << "\" format=\"ascii\">\n";
        for (int j = 0; j < nq; ++j) {
            file << "         ";
            for (int i = 0; i < nr; ++i)
                file << " " << primitives[g.index(i, j)].*field;
            file << "\n";
        }
        file << "        </DataArray>\n";
    };

    writeScalar("Density", &PrimitiveState::rho);
    writeScalar("Pressure", &PrimitiveState::p);

    // Velocity rotated into the (x, z) plane
    file << "        <DataArray type=\"Float64\" Name=\"Velocity\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (int j = 0; j < nq; ++j) {
        double q = g.cellQ(j);
        file << "         ";
        for (int i = 0; i < nr; ++i) {
            const PrimitiveState& W = primitives[g.index(i, j)];
            file << " " << W.ur * std::sin(q) + W.uq * std::cos(q)
                 << " 0 " << W.ur * std::cos(q) - W.uq * std::sin(q);
        }
        file << "\n";
    }
    file << "        </DataArray>\n";

    writeScalar("Scalar", &PrimitiveState::scalar);

    file << "        <DataArray type=\"Int32\" Name=\"Block\" format=\"ascii\">\n";
    for (int j = 0; j < nq; ++j) {
        file << "         ";
        for (int i = 0; i < nr; ++i)
            file << " " << blockId;
        file << "\n";
    }
    file << "        </DataArray>\n";

    file << "      </CellData>\n";
    file << "    </Piece>\n";
    file << "  </StructuredGrid>\n";
    file << "</VTKFile>\n";

    file.close();
}

void VTKWriter::writePVTS(const std::string& filename,
                          int globalNr, int globalNq,
                          const std::vector<std::array<int,6>>& pieceExtents,
                          const std::vector<std::string>& pieceFiles)
{
    ensureParentDir(filename);
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("VTKWriter::writePVTS: cannot open " + filename);
    }

    file << "<?xml version=\"1.0\"?>\n";
    file << "<VTKFile type=\"PStructuredGrid\" version=\"1.0\" byte_order=\"LittleEndian\">\n";
    file << "  <PStructuredGrid WholeExtent=\"0 " << globalNr
         << " 0 " << globalNq
         << " 0 0\" GhostLevel=\"0\">\n";

    file << "    <PPoints>\n";
    file << "      <PDataArray type=\"Float64\" NumberOfComponents=\"3\"/>\n";
    file << "    </PPoints>\n";

    file << "    <PCellData>\n";
    for (const auto& field : cellFields) {
        file << "      <PDataArray type=\"Float64\" Name=\"" << field[0] << "\"";
        if (field[1][0] != '1') file << " NumberOfComponents=\"" << field[1] << "\"";
        file << "/>\n";
    }
    file << "      <PDataArray type=\"Int32\" Name=\"Block\"/>\n";
    file << "    </PCellData>\n";

    // Reference each piece file with its extent
    for (std::size_t p = 0; p < pieceFiles.size(); ++p) {
        const auto& ext = pieceExtents[p];
        file << "    <Piece Extent=\""
             << ext[0] << " " << ext[1] << " "
             << ext[2] << " " << ext[3] << " "
             << ext[4] << " " << ext[5]
             << "\" Source=\"" << pieceFiles[p] << "\"/>\n";
    }

    file << "  </PStructuredGrid>\n";
    file << "</VTKFile>\n";

    file.close();
}

// PVD footer written after every append so the file is always valid XML
// and can be opened in ParaView while the simulation is still running.
static const std::string pvdFooter = "  </Collection>\n</VTKFile>\n";

void VTKWriter::writePVD(const std::string& filename,
                         const std::string& mode,
                         double time,
                         const std::string& dataFile)
{
    ensureParentDir(filename);
    if (mode == "w") {
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("VTKWriter::writePVD: cannot open " + filename);
        }
        file << "<?xml version=\"1.0\"?>\n";
        file << "<VTKFile type=\"Collection\" version=\"1.0\" byte_order=\"LittleEndian\">\n";
        file << "  <Collection>\n";
        file << pvdFooter;
        file.close();
    } else if (mode == "a") {
        // Truncate the closing tags, append new entry, re-write closing tags.
        auto fileSize = std::filesystem::file_size(filename);
        if (fileSize < pvdFooter.size()) {
            throw std::runtime_error("VTKWriter::writePVD: " + filename + " is not a collection file");
        }
        std::filesystem::resize_file(filename, fileSize - pvdFooter.size());

        std::ofstream file(filename, std::ios::app);
        if (!file.is_open()) {
            throw std::runtime_error("VTKWriter::writePVD: cannot open " + filename);
        }
        file << std::setprecision(15);
        file << "    <DataSet timestep=\"" << time
             << "\" file=\"" << dataFile << "\"/>\n";
        file << pvdFooter;
        file.close();
    }
    // "close" is a no-op; the file is always kept in a valid state.
}

void VTKWriter::truncatePVD(const std::string& filename, int numKept) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("VTKWriter::truncatePVD: cannot open " + filename);
    }

    std::ostringstream kept;
    std::string line;
    int numEntries = 0;
    bool inCollection = false;
    while (std::getline(in, line)) {
        if (line.find("<DataSet ") != std::string::npos) {
            if (numEntries++ < numKept) kept << line << "\n";
            continue;
        }
        if (line.find("</Collection>") != std::string::npos) break;
        kept << line << "\n";
        if (line.find("<Collection>") != std::string::npos) inCollection = true;
    }
    if (!inCollection) {
        throw std::runtime_error("VTKWriter::truncatePVD: " + filename + " is not a collection file");
    }
    in.close();

    std::ofstream out(filename, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("VTKWriter::truncatePVD: cannot open " + filename);
    }
    out << kept.str() << pvdFooter;
}

} // namespace Kilonova
