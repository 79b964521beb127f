#include "services/preprocessing/tissue_table.hpp"

#include <gtest/gtest.h>

namespace dicom_mesher::services {
namespace {

TEST(TissueTableTest, BoneThresholds) {
    auto bone = TissueTable::lookup("bone");
    ASSERT_TRUE(bone.has_value());

    EXPECT_EQ(bone->name, "bone");
    EXPECT_DOUBLE_EQ(bone->lowThreshold, 150.0);
    EXPECT_DOUBLE_EQ(bone->innerLowThreshold, 800.0);
    EXPECT_DOUBLE_EQ(bone->innerHighThreshold, 1500.0);
    EXPECT_DOUBLE_EQ(bone->highThreshold, 2000.0);
    EXPECT_FALSE(bone->useMedian);
}

TEST(TissueTableTest, SoftTissueUsesMedian) {
    auto soft = TissueTable::lookup("soft");
    ASSERT_TRUE(soft.has_value());

    EXPECT_DOUBLE_EQ(soft->lowThreshold, -15.0);
    EXPECT_DOUBLE_EQ(soft->highThreshold, 100.0);
    EXPECT_TRUE(soft->useMedian);
}

TEST(TissueTableTest, LookupIsCaseInsensitive) {
    auto upper = TissueTable::lookup("BONE");
    auto mixed = TissueTable::lookup("Muscle");

    ASSERT_TRUE(upper.has_value());
    ASSERT_TRUE(mixed.has_value());
    EXPECT_EQ(upper->name, "bone");
    EXPECT_EQ(mixed->name, "muscle");
}

TEST(TissueTableTest, AliasesResolveToCanonicalEntry) {
    EXPECT_EQ(TissueTable::lookup("bones")->name, "bone");
    EXPECT_EQ(TissueTable::lookup("soft_tissue")->name, "soft");
    EXPECT_EQ(TissueTable::lookup("soft-tissue")->name, "soft");
}

TEST(TissueTableTest, UnknownTissueFails) {
    auto result = TissueTable::lookup("cartilage");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::UnknownTissue);
    EXPECT_NE(result.error().message.find("cartilage"), std::string::npos);
    EXPECT_NE(result.error().message.find("bone"), std::string::npos);
}

TEST(TissueTableTest, EveryEntryIsOrdered) {
    auto names = TissueTable::names();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names.front(), "bone");

    for (const auto& name : names) {
        auto tissue = TissueTable::lookup(name);
        ASSERT_TRUE(tissue.has_value()) << name;
        EXPECT_TRUE(tissue->isValid()) << name;
    }
}

TEST(TissueTableTest, CustomSortsThresholds) {
    auto custom = TissueTable::custom({400.0, 100.0, 900.0, 300.0});
    ASSERT_TRUE(custom.has_value());

    EXPECT_EQ(custom->name, "custom");
    EXPECT_DOUBLE_EQ(custom->lowThreshold, 100.0);
    EXPECT_DOUBLE_EQ(custom->innerLowThreshold, 300.0);
    EXPECT_DOUBLE_EQ(custom->innerHighThreshold, 400.0);
    EXPECT_DOUBLE_EQ(custom->highThreshold, 900.0);
    EXPECT_FALSE(custom->useMedian);
}

TEST(TissueTableTest, CustomNeedsFourValues) {
    auto three = TissueTable::custom({1.0, 2.0, 3.0});
    ASSERT_FALSE(three.has_value());
    EXPECT_EQ(three.error().code, PipelineError::Code::InvalidConfiguration);

    EXPECT_FALSE(TissueTable::custom({1.0, 2.0, 3.0, 4.0, 5.0}).has_value());
}

TEST(TissueTableTest, CustomRejectsEmptyBand) {
    auto flat = TissueTable::custom({7.0, 7.0, 7.0, 7.0});

    ASSERT_FALSE(flat.has_value());
    EXPECT_EQ(flat.error().code, PipelineError::Code::InvalidConfiguration);
}

}  // namespace
}  // namespace dicom_mesher::services
