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

/**
 * @file object_isolator.hpp
 * @brief Keep a single anatomical object out of a multi-part mesh
 * @details Splits a mesh into connected components (components share no
 *          vertex), lets an IComponentSelector choose which to keep and
 *          writes only those. The default selector keeps the component
 *          with the most triangles, which for head CT bone surfaces is the
 *          skull; the extent-range selector also rejects objects whose
 *          bounding box is implausibly small or large.
 */

#pragma once

#include <array>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <vtkType.h>

#include "services/mesh/mesh_types.hpp"
#include "services/pipeline_error.hpp"

namespace dicom_mesher::services {

/// One connected component of a mesh
struct ComponentInfo {
    vtkIdType regionId = 0;
    size_t triangleCount = 0;
    std::array<double, 6> bounds{};     ///< [xmin, xmax, ymin, ymax, zmin, zmax]

    /// Largest bounding-box side
    [[nodiscard]] double maxExtent() const noexcept;
};

/**
 * @brief Strategy choosing which components to keep
 */
class IComponentSelector {
public:
    virtual ~IComponentSelector() = default;

    /// Region ids to keep; empty when nothing qualifies
    [[nodiscard]] virtual std::vector<vtkIdType>
    select(const std::vector<ComponentInfo>& components) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/// Keeps the component with the most triangles (lowest region id on ties)
class LargestComponentSelector : public IComponentSelector {
public:
    [[nodiscard]] std::vector<vtkIdType>
    select(const std::vector<ComponentInfo>& components) const override;

    [[nodiscard]] std::string name() const override { return "largest"; }
};

/// Keeps the largest component whose maximum extent lies in [minExtent, maxExtent]
class ExtentRangeSelector : public IComponentSelector {
public:
    ExtentRangeSelector(double minExtent = 100.0, double maxExtent = 300.0);

    [[nodiscard]] std::vector<vtkIdType>
    select(const std::vector<ComponentInfo>& components) const override;

    [[nodiscard]] std::string name() const override { return "extent_range"; }

private:
    double minExtent_;
    double maxExtent_;
};

struct IsolationResult {
    std::filesystem::path outputPath;
    size_t componentCount = 0;
    std::vector<vtkIdType> keptRegions;
    size_t keptTriangles = 0;
    size_t discardedTriangles = 0;
};

/**
 * @brief Connected-component isolation of mesh files
 */
class ObjectIsolator {
public:
    /// Uses LargestComponentSelector
    ObjectIsolator();
    explicit ObjectIsolator(std::shared_ptr<const IComponentSelector> selector);
    ~ObjectIsolator();

    // Non-copyable, movable
    ObjectIsolator(const ObjectIsolator&) = delete;
    ObjectIsolator& operator=(const ObjectIsolator&) = delete;
    ObjectIsolator(ObjectIsolator&&) noexcept;
    ObjectIsolator& operator=(ObjectIsolator&&) noexcept;

    /// Connected components of @p mesh, ordered by region id
    [[nodiscard]] static std::vector<ComponentInfo> analyzeComponents(const MeshPointer& mesh);

    /**
     * @brief Keep the selected components of an in-memory mesh
     * @return The isolated mesh, or NoTargetObject
     */
    [[nodiscard]] std::expected<MeshPointer, PipelineError>
    isolateMesh(const MeshPointer& mesh, IsolationResult* details = nullptr) const;

    /**
     * @brief Read @p meshPath, isolate, write @p outputPath (same format rules as writeMesh)
     */
    [[nodiscard]] std::expected<IsolationResult, PipelineError>
    isolate(const std::filesystem::path& meshPath,
            const std::filesystem::path& outputPath) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_mesher::services
