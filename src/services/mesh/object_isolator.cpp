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

#include "services/mesh/object_isolator.hpp"

#include <algorithm>
#include <limits>

#include <vtkCellData.h>
#include <vtkCleanPolyData.h>
#include <vtkDataArray.h>
#include <vtkIdList.h>
#include <vtkNew.h>
#include <vtkPointData.h>
#include <vtkPolyDataConnectivityFilter.h>
#include <vtkTriangleFilter.h>

#include "core/logging.hpp"
#include "services/mesh/mesh_io.hpp"

namespace dicom_mesher::services {

namespace {

constexpr const char* kRegionIdArray = "RegionId";

/// Merged-point triangle mesh, so components are defined by shared vertices
MeshPointer prepareMesh(const MeshPointer& mesh)
{
    vtkNew<vtkCleanPolyData> cleaner;
    cleaner->SetInputData(mesh);
    cleaner->SetTolerance(0.0);

    vtkNew<vtkTriangleFilter> triangulator;
    triangulator->SetInputConnection(cleaner->GetOutputPort());
    triangulator->PassVertsOff();
    triangulator->PassLinesOff();
    triangulator->Update();

    return triangulator->GetOutput();
}

PipelineError noTarget(const std::string& message)
{
    return PipelineError{PipelineError::Code::NoTargetObject, "isolate", message};
}

}  // namespace

double ComponentInfo::maxExtent() const noexcept
{
    return std::max({bounds[1] - bounds[0], bounds[3] - bounds[2], bounds[5] - bounds[4]});
}

// =============================================================================
// Selectors
// =============================================================================

std::vector<vtkIdType>
LargestComponentSelector::select(const std::vector<ComponentInfo>& components) const
{
    const ComponentInfo* best = nullptr;
    for (const auto& component : components) {
        if (component.triangleCount == 0) continue;
        if (best == nullptr || component.triangleCount > best->triangleCount) {
            best = &component;
        }
    }
    if (best == nullptr) {
        return {};
    }
    return {best->regionId};
}

ExtentRangeSelector::ExtentRangeSelector(double minExtent, double maxExtent)
    : minExtent_(minExtent), maxExtent_(maxExtent) {}

std::vector<vtkIdType>
ExtentRangeSelector::select(const std::vector<ComponentInfo>& components) const
{
    std::vector<ComponentInfo> plausible;
    for (const auto& component : components) {
        const double extent = component.maxExtent();
        if (extent >= minExtent_ && extent <= maxExtent_) {
            plausible.push_back(component);
        }
    }
    return LargestComponentSelector{}.select(plausible);
}

// =============================================================================
// ObjectIsolator
// =============================================================================

class ObjectIsolator::Impl {
public:
    std::shared_ptr<const IComponentSelector> selector;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(std::shared_ptr<const IComponentSelector> s)
        : selector(std::move(s))
        , logger(logging::LoggerFactory::create("ObjectIsolator")) {}
};

ObjectIsolator::ObjectIsolator()
    : ObjectIsolator(std::make_shared<LargestComponentSelector>()) {}

ObjectIsolator::ObjectIsolator(std::shared_ptr<const IComponentSelector> selector)
    : impl_(std::make_unique<Impl>(std::move(selector))) {}

ObjectIsolator::~ObjectIsolator() = default;

ObjectIsolator::ObjectIsolator(ObjectIsolator&&) noexcept = default;
ObjectIsolator& ObjectIsolator::operator=(ObjectIsolator&&) noexcept = default;

std::vector<ComponentInfo> ObjectIsolator::analyzeComponents(const MeshPointer& mesh)
{
    std::vector<ComponentInfo> components;
    if (!mesh || mesh->GetNumberOfCells() == 0) {
        return components;
    }

    vtkNew<vtkPolyDataConnectivityFilter> connectivity;
    connectivity->SetInputData(mesh);
    connectivity->SetExtractionModeToAllRegions();
    connectivity->ColorRegionsOn();
    connectivity->Update();

    const int regionCount = connectivity->GetNumberOfExtractedRegions();
    components.resize(static_cast<size_t>(regionCount));
    for (int region = 0; region < regionCount; ++region) {
        auto& component = components[static_cast<size_t>(region)];
        component.regionId = region;
        component.bounds = {
            std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest(),
            std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest(),
            std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest()};
    }

    vtkPolyData* labeled = connectivity->GetOutput();
    vtkDataArray* cellRegions = labeled->GetCellData()->GetArray(kRegionIdArray);
    vtkDataArray* pointRegions = labeled->GetPointData()->GetArray(kRegionIdArray);

    vtkNew<vtkIdList> cellPoints;
    for (vtkIdType cellId = 0; cellId < labeled->GetNumberOfCells(); ++cellId) {
        labeled->GetCellPoints(cellId, cellPoints);
        if (cellPoints->GetNumberOfIds() == 0) continue;

        vtkIdType region = -1;
        if (cellRegions != nullptr) {
            region = static_cast<vtkIdType>(cellRegions->GetTuple1(cellId));
        } else if (pointRegions != nullptr) {
            region = static_cast<vtkIdType>(pointRegions->GetTuple1(cellPoints->GetId(0)));
        }
        if (region < 0 || region >= regionCount) continue;

        auto& component = components[static_cast<size_t>(region)];
        ++component.triangleCount;
        for (vtkIdType i = 0; i < cellPoints->GetNumberOfIds(); ++i) {
            double p[3];
            labeled->GetPoint(cellPoints->GetId(i), p);
            for (int axis = 0; axis < 3; ++axis) {
                component.bounds[2 * axis] = std::min(component.bounds[2 * axis], p[axis]);
                component.bounds[2 * axis + 1] = std::max(component.bounds[2 * axis + 1], p[axis]);
            }
        }
    }

    std::erase_if(components, [](const ComponentInfo& c) { return c.triangleCount == 0; });
    return components;
}

std::expected<MeshPointer, PipelineError>
ObjectIsolator::isolateMesh(const MeshPointer& mesh, IsolationResult* details) const
{
    if (!mesh || mesh->GetNumberOfPolys() == 0) {
        return std::unexpected(noTarget("Mesh has no triangles"));
    }

    auto prepared = prepareMesh(mesh);
    auto components = analyzeComponents(prepared);
    if (components.empty()) {
        return std::unexpected(noTarget("Mesh has no connected components"));
    }

    auto selected = impl_->selector->select(components);
    if (selected.empty()) {
        return std::unexpected(noTarget(
            "Selector '" + impl_->selector->name() + "' accepted none of " +
            std::to_string(components.size()) + " components"));
    }

    vtkNew<vtkPolyDataConnectivityFilter> connectivity;
    connectivity->SetInputData(prepared);
    connectivity->SetExtractionModeToSpecifiedRegions();
    connectivity->InitializeSpecifiedRegionList();
    for (auto region : selected) {
        connectivity->AddSpecifiedRegion(region);
    }

    vtkNew<vtkCleanPolyData> pruner;
    pruner->SetInputConnection(connectivity->GetOutputPort());
    pruner->Update();

    MeshPointer isolated = pruner->GetOutput();
    if (isolated->GetNumberOfPolys() == 0) {
        return std::unexpected(noTarget("Selected components are empty"));
    }

    size_t total = 0;
    for (const auto& component : components) {
        total += component.triangleCount;
    }
    const auto kept = static_cast<size_t>(isolated->GetNumberOfPolys());

    impl_->logger->info("{} components, kept {} ({} of {} triangles) with selector '{}'",
                        components.size(), selected.size(), kept, total,
                        impl_->selector->name());

    if (details != nullptr) {
        details->componentCount = components.size();
        details->keptRegions = selected;
        details->keptTriangles = kept;
        details->discardedTriangles = total > kept ? total - kept : 0;
    }
    return isolated;
}

std::expected<IsolationResult, PipelineError>
ObjectIsolator::isolate(const std::filesystem::path& meshPath,
                        const std::filesystem::path& outputPath) const
{
    auto mesh = readMesh(meshPath);
    if (!mesh) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "read_mesh", mesh.error().message});
    }

    IsolationResult result;
    auto isolated = isolateMesh(*mesh, &result);
    if (!isolated) {
        return std::unexpected(isolated.error());
    }

    auto written = writeMesh(*isolated, outputPath);
    if (!written) {
        return std::unexpected(PipelineError{
            PipelineError::Code::StudyIO, "write_mesh", written.error().message});
    }

    result.outputPath = outputPath;
    return result;
}

}  // namespace dicom_mesher::services
