#pragma once

#include <expected>
#include <filesystem>

#include "core/image_converter.hpp"
#include "services/mesh/mesh_types.hpp"

namespace dicom_mesher::services {

/**
 * @brief Mesh primitives used by MeshFinisher
 *
 * Operations return a new mesh and leave their input untouched.
 */
class IMeshOperations {
public:
    virtual ~IMeshOperations() = default;

    /// Iso-surface of the image, oriented into patient space
    [[nodiscard]] virtual std::expected<MeshPointer, MeshStageError>
    extract(const core::MeshInput& input, double isoValue) const = 0;

    /// Merge duplicate points, triangulate, optionally keep the largest region
    [[nodiscard]] virtual std::expected<MeshPointer, MeshStageError>
    clean(const MeshPointer& mesh, bool keepLargestRegion) const = 0;

    [[nodiscard]] virtual std::expected<MeshPointer, MeshStageError>
    smooth(const MeshPointer& mesh, int iterations, double passBand) const = 0;

    /// Remove approximately @p reduction of the triangles
    [[nodiscard]] virtual std::expected<MeshPointer, MeshStageError>
    decimate(const MeshPointer& mesh, double reduction) const = 0;

    [[nodiscard]] virtual std::expected<MeshPointer, MeshStageError>
    rotate(const MeshPointer& mesh, const MeshRotation& rotation) const = 0;

    [[nodiscard]] virtual std::expected<void, MeshStageError>
    write(const MeshPointer& mesh, const std::filesystem::path& path, STLFormat stlFormat) const = 0;
};

/**
 * @brief IMeshOperations backed by VTK filters
 */
class VtkMeshOperations : public IMeshOperations {
public:
    [[nodiscard]] std::expected<MeshPointer, MeshStageError>
    extract(const core::MeshInput& input, double isoValue) const override;

    [[nodiscard]] std::expected<MeshPointer, MeshStageError>
    clean(const MeshPointer& mesh, bool keepLargestRegion) const override;

    [[nodiscard]] std::expected<MeshPointer, MeshStageError>
    smooth(const MeshPointer& mesh, int iterations, double passBand) const override;

    [[nodiscard]] std::expected<MeshPointer, MeshStageError>
    decimate(const MeshPointer& mesh, double reduction) const override;

    [[nodiscard]] std::expected<MeshPointer, MeshStageError>
    rotate(const MeshPointer& mesh, const MeshRotation& rotation) const override;

    [[nodiscard]] std::expected<void, MeshStageError>
    write(const MeshPointer& mesh, const std::filesystem::path& path, STLFormat stlFormat) const override;
};

}  // namespace dicom_mesher::services
