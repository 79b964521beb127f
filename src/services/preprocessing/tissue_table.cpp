#include "services/preprocessing/tissue_table.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace dicom_mesher::services {

namespace {

struct TissueEntry {
    TissueConfig config;
    std::vector<std::string_view> aliases;
};

const std::vector<TissueEntry>& tissueEntries() {
    static const std::vector<TissueEntry> entries = {
        {{"bone", 150.0, 800.0, 1500.0, 2000.0, false, 64.0}, {"bones"}},
        {{"skin", -200.0, 0.0, 500.0, 1500.0, false, 64.0}, {}},
        {{"muscle", 10.0, 35.0, 55.0, 90.0, true, 64.0}, {"muscles"}},
        {{"soft", -15.0, 30.0, 58.0, 100.0, true, 64.0}, {"soft_tissue", "soft-tissue"}},
        {{"fat", -122.0, -112.0, -96.0, -70.0, true, 64.0}, {}},
    };
    return entries;
}

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

}  // namespace

std::expected<TissueConfig, PipelineError>
TissueTable::lookup(std::string_view name)
{
    const auto key = toLower(name);
    for (const auto& entry : tissueEntries()) {
        if (entry.config.name == key ||
            std::find(entry.aliases.begin(), entry.aliases.end(), key) != entry.aliases.end()) {
            return entry.config;
        }
    }

    std::string known;
    for (const auto& tissue : names()) {
        known += known.empty() ? tissue : ", " + tissue;
    }
    return std::unexpected(PipelineError{
        PipelineError::Code::UnknownTissue,
        "tissue_lookup",
        std::format("Unknown tissue '{}' (known: {})", name, known)
    });
}

std::vector<std::string> TissueTable::names()
{
    std::vector<std::string> result;
    for (const auto& entry : tissueEntries()) {
        result.push_back(entry.config.name);
    }
    return result;
}

std::expected<TissueConfig, PipelineError>
TissueTable::custom(std::vector<double> thresholds)
{
    if (thresholds.size() != 4) {
        return std::unexpected(PipelineError{
            PipelineError::Code::InvalidConfiguration,
            "tissue_lookup",
            std::format("Double threshold needs exactly 4 values, got {}", thresholds.size())
        });
    }

    std::sort(thresholds.begin(), thresholds.end());

    TissueConfig config;
    config.name = "custom";
    config.lowThreshold = thresholds[0];
    config.innerLowThreshold = thresholds[1];
    config.innerHighThreshold = thresholds[2];
    config.highThreshold = thresholds[3];

    if (!config.isValid()) {
        return std::unexpected(PipelineError{
            PipelineError::Code::InvalidConfiguration,
            "tissue_lookup",
            "Double threshold band is empty"
        });
    }
    return config;
}

}  // namespace dicom_mesher::services
