#include "services/pipeline/pipeline_config.hpp"

#include <format>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace dicom_mesher::services {

namespace {

PipelineError invalidConfig(const std::string& message)
{
    return PipelineError{PipelineError::Code::InvalidConfiguration, "configuration", message};
}

template <typename T>
void takeIfSet(std::optional<T>& target, const std::optional<T>& source)
{
    if (source) {
        target = source;
    }
}

template <typename T>
void readKey(const nlohmann::json& j, const char* key, std::optional<T>& target)
{
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

}  // namespace

void ConfigOverrides::merge(const ConfigOverrides& higher)
{
    takeIfSet(preset, higher.preset);
    takeIfSet(tissue, higher.tissue);
    takeIfSet(isoValue, higher.isoValue);
    takeIfSet(thresholds, higher.thresholds);
    takeIfSet(shrink, higher.shrink);
    takeIfSet(shrinkMaxDimension, higher.shrinkMaxDimension);
    takeIfSet(anisotropic, higher.anisotropic);
    takeIfSet(median, higher.median);
    takeIfSet(largestRegion, higher.largestRegion);
    takeIfSet(rotation, higher.rotation);
    takeIfSet(rotationAxis, higher.rotationAxis);
    takeIfSet(rotationAngle, higher.rotationAngle);
    takeIfSet(smoothingIterations, higher.smoothingIterations);
    takeIfSet(reduction, higher.reduction);
    takeIfSet(padVoxels, higher.padVoxels);
    takeIfSet(requireCT, higher.requireCT);
    takeIfSet(writeVolumeInfo, higher.writeVolumeInfo);
}

std::vector<std::string> presetNames()
{
    return {"default", "skullnet"};
}

std::expected<ConfigOverrides, PipelineError>
presetOverrides(std::string_view name)
{
    ConfigOverrides preset;
    if (name == "default") {
        return preset;
    }
    if (name == "skullnet") {
        // Tuned for head CT skull surfaces
        preset.shrink = false;
        preset.isoValue = 150.0;
        preset.smoothingIterations = 5000;
        preset.reduction = 0.75;
        return preset;
    }
    return std::unexpected(invalidConfig(std::format("Unknown preset '{}'", name)));
}

std::expected<PipelineConfig, PipelineError>
resolvePipelineConfig(const ConfigOverrides& overrides)
{
    if (overrides.tissue && overrides.isoValue) {
        return std::unexpected(invalidConfig(
            "A tissue type and an explicit iso-value cannot both be given"));
    }
    if (overrides.tissue && overrides.thresholds) {
        return std::unexpected(invalidConfig(
            "A tissue type and explicit double thresholds cannot both be given"));
    }

    PipelineConfig config;
    config.preset = overrides.preset.value_or("default");

    auto layered = presetOverrides(config.preset);
    if (!layered) {
        return std::unexpected(layered.error());
    }
    layered->merge(overrides);
    const ConfigOverrides& o = *layered;

    if (o.shrinkMaxDimension && *o.shrinkMaxDimension < 1) {
        return std::unexpected(invalidConfig("Shrink max dimension must be at least 1"));
    }
    if (o.smoothingIterations && *o.smoothingIterations < 0) {
        return std::unexpected(invalidConfig("Smoothing iterations must not be negative"));
    }
    if (o.reduction && (*o.reduction < 0.0 || *o.reduction >= 1.0)) {
        return std::unexpected(invalidConfig(
            std::format("Reduction {} is outside [0, 1)", *o.reduction)));
    }
    if (o.rotationAxis && (*o.rotationAxis < 0 || *o.rotationAxis > 2)) {
        return std::unexpected(invalidConfig(
            std::format("Rotation axis {} is not 0, 1 or 2", *o.rotationAxis)));
    }

    // Tissue: keyword lookup or ad-hoc thresholds
    std::optional<TissueConfig> tissue;
    if (o.tissue) {
        auto found = TissueTable::lookup(*o.tissue);
        if (!found) {
            return std::unexpected(found.error());
        }
        tissue = *found;
    } else if (o.thresholds) {
        if (o.thresholds->size() != 4) {
            return std::unexpected(invalidConfig(std::format(
                "Double threshold needs 4 values, got {}", o.thresholds->size())));
        }
        auto custom = TissueTable::custom(*o.thresholds);
        if (!custom) {
            return std::unexpected(custom.error());
        }
        tissue = *custom;
    }

    auto& pre = config.preprocess;
    if (o.shrink) pre.shrinkEnabled = *o.shrink;
    if (o.shrinkMaxDimension) pre.shrinkMaxDimension = *o.shrinkMaxDimension;
    if (o.anisotropic) pre.smoothingEnabled = *o.anisotropic;
    pre.tissue = tissue;
    pre.medianEnabled = o.median.value_or(tissue ? tissue->useMedian : false);
    if (o.padVoxels) pre.padVoxels = *o.padVoxels;
    // Thresholded volumes are 0/255; raw intensities need a pad below any iso-value
    pre.padValue = tissue ? short{0} : std::numeric_limits<short>::min();

    auto& mesh = config.mesh;
    if (overrides.isoValue) {
        mesh.isoValue = *overrides.isoValue;
    } else if (tissue) {
        mesh.isoValue = tissue->defaultIsoValue;
    } else if (o.isoValue) {
        mesh.isoValue = *o.isoValue;
    }
    if (o.smoothingIterations) mesh.smoothingIterations = *o.smoothingIterations;
    if (o.reduction) mesh.decimationReduction = *o.reduction;
    if (o.largestRegion) mesh.keepLargestRegion = *o.largestRegion;
    if (o.rotation.value_or(false)) {
        MeshRotation rotation;
        if (o.rotationAxis) rotation.axis = *o.rotationAxis;
        if (o.rotationAngle) rotation.angleDegrees = *o.rotationAngle;
        mesh.rotation = rotation;
    }

    config.requireCT = o.requireCT.value_or(false);
    config.writeVolumeInfo = o.writeVolumeInfo.value_or(false);

    if (!mesh.isValid()) {
        return std::unexpected(invalidConfig("Mesh options are inconsistent"));
    }
    return config;
}

std::expected<ConfigOverrides, PipelineError>
parseOverrides(std::string_view jsonText)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(invalidConfig(std::string("Malformed configuration JSON: ") + e.what()));
    }
    if (!j.is_object()) {
        return std::unexpected(invalidConfig("Configuration JSON must be an object"));
    }

    ConfigOverrides o;
    try {
        readKey(j, "preset", o.preset);
        readKey(j, "tissue", o.tissue);
        readKey(j, "isovalue", o.isoValue);
        readKey(j, "thresholds", o.thresholds);
        readKey(j, "shrink", o.shrink);
        readKey(j, "shrink_max", o.shrinkMaxDimension);
        readKey(j, "anisotropic", o.anisotropic);
        readKey(j, "median", o.median);
        readKey(j, "largest", o.largestRegion);
        readKey(j, "rotation", o.rotation);
        readKey(j, "rotation_axis", o.rotationAxis);
        readKey(j, "rotation_angle", o.rotationAngle);
        readKey(j, "smooth_iterations", o.smoothingIterations);
        readKey(j, "reduction", o.reduction);
        readKey(j, "pad", o.padVoxels);
        readKey(j, "require_ct", o.requireCT);
        readKey(j, "write_volume_info", o.writeVolumeInfo);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(invalidConfig(std::string("Bad configuration value: ") + e.what()));
    }
    return o;
}

std::expected<ConfigOverrides, PipelineError>
loadOverridesFile(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(invalidConfig("Cannot open configuration file: " + path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseOverrides(buffer.str());
}

std::string describe(const PipelineConfig& config)
{
    const auto& pre = config.preprocess;
    const auto& mesh = config.mesh;

    std::string text = std::format("preset={}", config.preset);
    if (pre.tissue) {
        text += std::format(" tissue={} [{} {} {} {}]", pre.tissue->name,
                            pre.tissue->lowThreshold, pre.tissue->innerLowThreshold,
                            pre.tissue->innerHighThreshold, pre.tissue->highThreshold);
    }
    text += std::format(" iso={} shrink={} anisotropic={} median={} pad={}",
                        mesh.isoValue,
                        pre.shrinkEnabled ? std::to_string(pre.shrinkMaxDimension) : "off",
                        pre.smoothingEnabled ? "on" : "off",
                        pre.medianEnabled ? "on" : "off", pre.padVoxels);
    text += std::format(" smooth={} reduce={}", mesh.smoothingIterations, mesh.decimationReduction);
    if (mesh.rotation) {
        text += std::format(" rotate=axis{}:{}", mesh.rotation->axis, mesh.rotation->angleDegrees);
    }
    if (mesh.keepLargestRegion) text += " largest";
    if (config.requireCT) text += " ct-only";
    return text;
}

}  // namespace dicom_mesher::services
