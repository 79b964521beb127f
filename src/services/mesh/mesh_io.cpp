// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "services/mesh/mesh_io.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <system_error>

#include <vtkErrorCode.h>
#include <vtkMassProperties.h>
#include <vtkNew.h>
#include <vtkOBJReader.h>
#include <vtkOBJWriter.h>
#include <vtkPLYReader.h>
#include <vtkPLYWriter.h>
#include <vtkPolyDataReader.h>
#include <vtkPolyDataWriter.h>
#include <vtkSTLReader.h>
#include <vtkSTLWriter.h>
#include <vtkTriangleFilter.h>

#include "core/logging.hpp"

namespace dicom_mesher::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MeshIO");
    return logger;
}

template <typename Reader>
MeshPointer runReader(const std::filesystem::path& path) {
    vtkNew<Reader> reader;
    reader->SetFileName(path.string().c_str());
    reader->Update();
    if (reader->GetErrorCode() != vtkErrorCode::NoError) {
        return nullptr;
    }
    MeshPointer mesh = MeshPointer::New();
    mesh->DeepCopy(reader->GetOutput());
    return mesh;
}

template <typename Writer>
bool runWriter(Writer* writer, const MeshPointer& mesh, const std::filesystem::path& path) {
    writer->SetInputData(mesh);
    writer->SetFileName(path.string().c_str());
    const int written = writer->Write();
    return written == 1 && writer->GetErrorCode() == vtkErrorCode::NoError;
}

bool writeWithFormat(const MeshPointer& mesh,
                     const std::filesystem::path& path,
                     MeshFormat format,
                     STLFormat stlFormat) {
    switch (format) {
        case MeshFormat::STL: {
            vtkNew<vtkSTLWriter> writer;
            if (stlFormat == STLFormat::Binary) {
                writer->SetFileTypeToBinary();
            } else {
                writer->SetFileTypeToASCII();
            }
            return runWriter(writer.Get(), mesh, path);
        }
        case MeshFormat::PLY: {
            vtkNew<vtkPLYWriter> writer;
            writer->SetFileTypeToBinary();
            return runWriter(writer.Get(), mesh, path);
        }
        case MeshFormat::OBJ: {
            vtkNew<vtkOBJWriter> writer;
            return runWriter(writer.Get(), mesh, path);
        }
        case MeshFormat::VTK: {
            vtkNew<vtkPolyDataWriter> writer;
            writer->SetFileTypeToBinary();
            return runWriter(writer.Get(), mesh, path);
        }
    }
    return false;
}

}  // namespace

std::optional<MeshFormat> detectFormat(const std::filesystem::path& path)
{
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".stl") return MeshFormat::STL;
    if (ext == ".ply") return MeshFormat::PLY;
    if (ext == ".obj") return MeshFormat::OBJ;
    if (ext == ".vtk") return MeshFormat::VTK;
    return std::nullopt;
}

std::string getFileExtension(MeshFormat format)
{
    switch (format) {
        case MeshFormat::STL: return ".stl";
        case MeshFormat::PLY: return ".ply";
        case MeshFormat::OBJ: return ".obj";
        case MeshFormat::VTK: return ".vtk";
    }
    return ".stl";
}

std::expected<MeshPointer, MeshStageError>
readMesh(const std::filesystem::path& path)
{
    if (!std::filesystem::is_regular_file(path)) {
        return std::unexpected(MeshStageError{
            MeshStage::Read, "Mesh file not found: " + path.string()});
    }

    auto format = detectFormat(path);
    if (!format) {
        return std::unexpected(MeshStageError{
            MeshStage::Read, "Unsupported mesh extension: " + path.string()});
    }

    MeshPointer mesh;
    switch (*format) {
        case MeshFormat::STL: mesh = runReader<vtkSTLReader>(path); break;
        case MeshFormat::PLY: mesh = runReader<vtkPLYReader>(path); break;
        case MeshFormat::OBJ: mesh = runReader<vtkOBJReader>(path); break;
        case MeshFormat::VTK: mesh = runReader<vtkPolyDataReader>(path); break;
    }

    if (!mesh) {
        return std::unexpected(MeshStageError{
            MeshStage::Read, "Reader failed for " + path.string()});
    }

    getLogger()->debug("Read {} ({} points, {} polygons)",
                       path.string(), mesh->GetNumberOfPoints(), mesh->GetNumberOfPolys());
    return mesh;
}

std::expected<void, MeshStageError>
writeMesh(const MeshPointer& mesh, const std::filesystem::path& path, STLFormat stlFormat)
{
    if (!mesh || mesh->GetNumberOfPoints() == 0) {
        return std::unexpected(MeshStageError{
            MeshStage::Write, "Empty or invalid mesh data"});
    }

    auto format = detectFormat(path);
    if (!format) {
        return std::unexpected(MeshStageError{
            MeshStage::Write, "Unsupported mesh extension: " + path.string()});
    }

    const auto parentPath = path.parent_path();
    if (!parentPath.empty() && !std::filesystem::is_directory(parentPath)) {
        return std::unexpected(MeshStageError{
            MeshStage::Write, "Output directory does not exist: " + parentPath.string()});
    }

    auto partialPath = path;
    partialPath += ".partial";

    std::error_code ec;
    if (!writeWithFormat(mesh, partialPath, *format, stlFormat)) {
        std::filesystem::remove(partialPath, ec);
        return std::unexpected(MeshStageError{
            MeshStage::Write, "Failed to write mesh file: " + path.string()});
    }

    std::filesystem::rename(partialPath, path, ec);
    if (ec) {
        std::error_code cleanupError;
        std::filesystem::remove(partialPath, cleanupError);
        return std::unexpected(MeshStageError{
            MeshStage::Write, "Cannot move mesh into place: " + ec.message()});
    }

    return {};
}

MeshStatistics computeStatistics(const MeshPointer& mesh)
{
    MeshStatistics stats;

    if (!mesh || mesh->GetNumberOfPoints() == 0) {
        return stats;
    }

    stats.vertexCount = static_cast<size_t>(mesh->GetNumberOfPoints());
    stats.triangleCount = static_cast<size_t>(mesh->GetNumberOfPolys());

    if (stats.triangleCount > 0) {
        vtkNew<vtkTriangleFilter> triangles;
        triangles->SetInputData(mesh);

        vtkNew<vtkMassProperties> massProperties;
        massProperties->SetInputConnection(triangles->GetOutputPort());
        massProperties->Update();

        stats.surfaceAreaMm2 = massProperties->GetSurfaceArea();
        stats.volumeMm3 = std::abs(massProperties->GetVolume());
    }

    double bounds[6];
    mesh->GetBounds(bounds);
    for (int i = 0; i < 6; ++i) {
        stats.boundingBox[i] = bounds[i];
    }

    return stats;
}

}  // namespace dicom_mesher::services
