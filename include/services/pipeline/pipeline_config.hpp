/**
 * @file pipeline_config.hpp
 * @brief Resolution of the per-run pipeline configuration
 * @details A run is configured in layers: built-in defaults, a named
 *          preset, a JSON overrides file and finally command-line
 *          overrides. Each layer is a ConfigOverrides where only the fields
 *          that layer sets are present; resolvePipelineConfig() validates
 *          the merged overrides and produces the immutable PipelineConfig.
 */

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "services/mesh/mesh_finisher.hpp"
#include "services/pipeline_error.hpp"
#include "services/preprocessing/volume_preprocessor.hpp"

namespace dicom_mesher::services {

/**
 * @brief Resolved, immutable configuration of one run
 */
struct PipelineConfig {
    std::string preset = "default";
    PreprocessOptions preprocess;
    MeshOptions mesh;
    bool requireCT = false;         ///< Reject non-CT studies
    bool writeVolumeInfo = false;   ///< Write `<stem>.volume.txt` next to the mesh
};

/**
 * @brief One configuration layer; unset fields leave lower layers alone
 */
struct ConfigOverrides {
    std::optional<std::string> preset;
    std::optional<std::string> tissue;
    std::optional<double> isoValue;
    std::optional<std::vector<double>> thresholds;

    std::optional<bool> shrink;
    std::optional<unsigned int> shrinkMaxDimension;
    std::optional<bool> anisotropic;
    std::optional<bool> median;
    std::optional<bool> largestRegion;
    std::optional<bool> rotation;
    std::optional<int> rotationAxis;
    std::optional<double> rotationAngle;
    std::optional<int> smoothingIterations;
    std::optional<double> reduction;
    std::optional<unsigned int> padVoxels;
    std::optional<bool> requireCT;
    std::optional<bool> writeVolumeInfo;

    /// Take every field that @p higher sets
    void merge(const ConfigOverrides& higher);
};

/// Names accepted by --preset, "default" first
[[nodiscard]] std::vector<std::string> presetNames();

/**
 * @brief Option values a preset changes relative to the built-in defaults
 * @return InvalidConfiguration for an unknown preset name
 */
[[nodiscard]] std::expected<ConfigOverrides, PipelineError>
presetOverrides(std::string_view name);

/**
 * @brief Validate @p overrides and build the run configuration
 *
 * The preset named in @p overrides (or "default") is applied first and
 * @p overrides on top. Conflicts are checked on @p overrides only, so an
 * explicit tissue may replace a preset's iso-value.
 */
[[nodiscard]] std::expected<PipelineConfig, PipelineError>
resolvePipelineConfig(const ConfigOverrides& overrides);

/// Parse the JSON text of an overrides file
[[nodiscard]] std::expected<ConfigOverrides, PipelineError>
parseOverrides(std::string_view jsonText);

[[nodiscard]] std::expected<ConfigOverrides, PipelineError>
loadOverridesFile(const std::filesystem::path& path);

/// One-line human readable description for the run banner
[[nodiscard]] std::string describe(const PipelineConfig& config);

}  // namespace dicom_mesher::services
