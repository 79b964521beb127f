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

#include "services/mesh/i_mesh_operations.hpp"

#include <vtkCleanPolyData.h>
#include <vtkImageData.h>
#include <vtkMarchingCubes.h>
#include <vtkMatrix4x4.h>
#include <vtkNew.h>
#include <vtkPolyDataConnectivityFilter.h>
#include <vtkQuadricDecimation.h>
#include <vtkTransform.h>
#include <vtkTransformPolyDataFilter.h>
#include <vtkTriangleFilter.h>
#include <vtkWindowedSincPolyDataFilter.h>

#include "services/mesh/mesh_io.hpp"

namespace dicom_mesher::services {

namespace {

/**
 * @brief Map grid-aligned points into patient space: p' = o + D (p - o)
 */
MeshPointer applyDirection(const MeshPointer& mesh, const core::MeshInput& input)
{
    vtkNew<vtkMatrix4x4> matrix;
    for (int row = 0; row < 3; ++row) {
        double offset = input.origin[row];
        for (int col = 0; col < 3; ++col) {
            const double d = input.direction[row * 3 + col];
            matrix->SetElement(row, col, d);
            offset -= d * input.origin[col];
        }
        matrix->SetElement(row, 3, offset);
    }

    vtkNew<vtkTransform> transform;
    transform->SetMatrix(matrix);

    vtkNew<vtkTransformPolyDataFilter> transformFilter;
    transformFilter->SetInputData(mesh);
    transformFilter->SetTransform(transform);
    transformFilter->Update();

    return transformFilter->GetOutput();
}

}  // namespace

std::expected<MeshPointer, MeshStageError>
VtkMeshOperations::extract(const core::MeshInput& input, double isoValue) const
{
    if (!input.image) {
        return std::unexpected(MeshStageError{MeshStage::Extract, "No image to extract from"});
    }

    vtkNew<vtkMarchingCubes> marchingCubes;
    marchingCubes->SetInputData(input.image);
    marchingCubes->SetValue(0, isoValue);
    marchingCubes->ComputeNormalsOff();
    marchingCubes->ComputeGradientsOff();
    marchingCubes->ComputeScalarsOff();
    marchingCubes->Update();

    MeshPointer surface = marchingCubes->GetOutput();
    if (!surface || surface->GetNumberOfPolys() == 0) {
        return std::unexpected(MeshStageError{
            MeshStage::Extract, "Iso-surface at " + std::to_string(isoValue) + " is empty"});
    }

    if (!input.hasIdentityDirection()) {
        surface = applyDirection(surface, input);
    }
    return surface;
}

std::expected<MeshPointer, MeshStageError>
VtkMeshOperations::clean(const MeshPointer& mesh, bool keepLargestRegion) const
{
    if (!mesh) {
        return std::unexpected(MeshStageError{MeshStage::Clean, "Mesh is null"});
    }

    vtkNew<vtkCleanPolyData> cleaner;
    cleaner->SetInputData(mesh);
    cleaner->SetTolerance(0.0);

    vtkNew<vtkTriangleFilter> triangulator;
    triangulator->SetInputConnection(cleaner->GetOutputPort());
    triangulator->Update();

    MeshPointer cleaned = triangulator->GetOutput();

    if (keepLargestRegion && cleaned->GetNumberOfPolys() > 0) {
        vtkNew<vtkPolyDataConnectivityFilter> connectivity;
        connectivity->SetInputData(cleaned);
        connectivity->SetExtractionModeToLargestRegion();

        vtkNew<vtkCleanPolyData> pruner;
        pruner->SetInputConnection(connectivity->GetOutputPort());
        pruner->Update();

        cleaned = pruner->GetOutput();
    }

    if (cleaned->GetNumberOfPolys() == 0) {
        return std::unexpected(MeshStageError{MeshStage::Clean, "No triangles left after cleaning"});
    }
    return cleaned;
}

std::expected<MeshPointer, MeshStageError>
VtkMeshOperations::smooth(const MeshPointer& mesh, int iterations, double passBand) const
{
    if (!mesh) {
        return std::unexpected(MeshStageError{MeshStage::Smooth, "Mesh is null"});
    }
    if (iterations <= 0) {
        return mesh;
    }

    vtkNew<vtkWindowedSincPolyDataFilter> smoother;
    smoother->SetInputData(mesh);
    smoother->SetNumberOfIterations(iterations);
    smoother->SetPassBand(passBand);
    smoother->BoundarySmoothingOff();
    smoother->FeatureEdgeSmoothingOff();
    smoother->NonManifoldSmoothingOn();
    smoother->NormalizeCoordinatesOn();
    smoother->Update();

    return MeshPointer(smoother->GetOutput());
}

std::expected<MeshPointer, MeshStageError>
VtkMeshOperations::decimate(const MeshPointer& mesh, double reduction) const
{
    if (!mesh) {
        return std::unexpected(MeshStageError{MeshStage::Decimate, "Mesh is null"});
    }
    if (reduction <= 0.0) {
        return mesh;
    }
    if (reduction >= 1.0) {
        return std::unexpected(MeshStageError{
            MeshStage::Decimate, "Reduction must be below 1.0"});
    }

    vtkNew<vtkQuadricDecimation> decimator;
    decimator->SetInputData(mesh);
    decimator->SetTargetReduction(reduction);
    decimator->VolumePreservationOn();
    decimator->Update();

    MeshPointer decimated = decimator->GetOutput();
    if (decimated->GetNumberOfPolys() == 0) {
        return std::unexpected(MeshStageError{
            MeshStage::Decimate, "Decimation removed every triangle"});
    }
    return decimated;
}

std::expected<MeshPointer, MeshStageError>
VtkMeshOperations::rotate(const MeshPointer& mesh, const MeshRotation& rotation) const
{
    if (!mesh) {
        return std::unexpected(MeshStageError{MeshStage::Rotate, "Mesh is null"});
    }
    if (!rotation.isValid()) {
        return std::unexpected(MeshStageError{
            MeshStage::Rotate, "Rotation axis must be 0, 1 or 2"});
    }

    vtkNew<vtkTransform> transform;
    switch (rotation.axis) {
        case 0: transform->RotateX(rotation.angleDegrees); break;
        case 1: transform->RotateY(rotation.angleDegrees); break;
        default: transform->RotateZ(rotation.angleDegrees); break;
    }

    vtkNew<vtkTransformPolyDataFilter> transformFilter;
    transformFilter->SetInputData(mesh);
    transformFilter->SetTransform(transform);
    transformFilter->Update();

    return MeshPointer(transformFilter->GetOutput());
}

std::expected<void, MeshStageError>
VtkMeshOperations::write(const MeshPointer& mesh,
                         const std::filesystem::path& path,
                         STLFormat stlFormat) const
{
    return writeMesh(mesh, path, stlFormat);
}

}  // namespace dicom_mesher::services
