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

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "services/mesh/mesh_io.hpp"
#include "test_utils/mesh_generator.hpp"

namespace dicom_mesher::services {
namespace {

namespace fs = std::filesystem;

ComponentInfo component(vtkIdType id, size_t triangles, double extent)
{
    ComponentInfo info;
    info.regionId = id;
    info.triangleCount = triangles;
    info.bounds = {0.0, extent, 0.0, extent / 2.0, 0.0, 1.0};
    return info;
}

// =============================================================================
// Selectors
// =============================================================================

TEST(ComponentSelectorTest, MaxExtentIsLargestSide) {
    ComponentInfo info;
    info.bounds = {-10.0, 10.0, 0.0, 50.0, 5.0, 6.0};
    EXPECT_DOUBLE_EQ(info.maxExtent(), 50.0);
}

TEST(ComponentSelectorTest, LargestPicksMostTriangles) {
    LargestComponentSelector selector;
    auto kept = selector.select({component(0, 5, 10), component(1, 1000, 150), component(2, 8, 10)});

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], 1);
}

TEST(ComponentSelectorTest, LargestTieKeepsFirst) {
    LargestComponentSelector selector;
    auto kept = selector.select({component(3, 40, 10), component(4, 40, 10)});

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], 3);
}

TEST(ComponentSelectorTest, LargestOfNothingIsEmpty) {
    LargestComponentSelector selector;
    EXPECT_TRUE(selector.select({}).empty());
}

TEST(ComponentSelectorTest, ExtentRangeRejectsImplausibleSizes) {
    ExtentRangeSelector selector(100.0, 300.0);

    // The biggest component is a table far wider than a head
    auto kept = selector.select({
        component(0, 5000, 600), component(1, 1000, 180), component(2, 30, 20)});

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], 1);
}

TEST(ComponentSelectorTest, ExtentRangeBoundsAreInclusive) {
    ExtentRangeSelector selector(100.0, 300.0);

    EXPECT_EQ(selector.select({component(0, 10, 100.0)}).size(), 1u);
    EXPECT_EQ(selector.select({component(0, 10, 300.0)}).size(), 1u);
    EXPECT_TRUE(selector.select({component(0, 10, 99.9)}).empty());
}

TEST(ComponentSelectorTest, Names) {
    EXPECT_EQ(LargestComponentSelector{}.name(), "largest");
    EXPECT_EQ(ExtentRangeSelector{}.name(), "extent_range");
}

// =============================================================================
// Component analysis and isolation
// =============================================================================

TEST(ObjectIsolatorTest, AnalyzeFindsThreeComponents) {
    auto mesh = test_utils::createSkullWithDebris();
    auto components = ObjectIsolator::analyzeComponents(mesh);

    ASSERT_EQ(components.size(), 3u);

    std::vector<size_t> counts;
    for (const auto& c : components) {
        counts.push_back(c.triangleCount);
    }
    std::sort(counts.begin(), counts.end());
    EXPECT_EQ(counts, (std::vector<size_t>{5, 8, 1000}));
}

TEST(ObjectIsolatorTest, KeepsOnlyLargestComponent) {
    ObjectIsolator isolator;
    IsolationResult details;

    auto isolated = isolator.isolateMesh(test_utils::createSkullWithDebris(), &details);
    ASSERT_TRUE(isolated.has_value());

    EXPECT_EQ((*isolated)->GetNumberOfPolys(), 1000);
    EXPECT_EQ(details.componentCount, 3u);
    EXPECT_EQ(details.keptTriangles, 1000u);
    EXPECT_EQ(details.discardedTriangles, 13u);
    EXPECT_EQ(details.keptRegions.size(), 1u);

    // Debris far out on +x and +y is gone
    double bounds[6];
    (*isolated)->GetBounds(bounds);
    EXPECT_LT(bounds[1], 61.0);
    EXPECT_LT(bounds[3], 61.0);
}

TEST(ObjectIsolatorTest, SingleComponentIsKeptWhole) {
    ObjectIsolator isolator;

    auto isolated = isolator.isolateMesh(test_utils::createSphereMesh());
    ASSERT_TRUE(isolated.has_value());
    EXPECT_EQ((*isolated)->GetNumberOfPolys(), 1000);
}

TEST(ObjectIsolatorTest, ExtentSelectorWithNoMatchFails) {
    ObjectIsolator isolator(std::make_shared<ExtentRangeSelector>(400.0, 500.0));

    auto isolated = isolator.isolateMesh(test_utils::createSkullWithDebris());
    ASSERT_FALSE(isolated.has_value());
    EXPECT_EQ(isolated.error().code, PipelineError::Code::NoTargetObject);
}

TEST(ObjectIsolatorTest, ExtentSelectorKeepsSkull) {
    ObjectIsolator isolator(std::make_shared<ExtentRangeSelector>(100.0, 300.0));

    auto isolated = isolator.isolateMesh(test_utils::createSkullWithDebris());
    ASSERT_TRUE(isolated.has_value());
    EXPECT_EQ((*isolated)->GetNumberOfPolys(), 1000);
}

TEST(ObjectIsolatorTest, EmptyMeshHasNoTarget) {
    ObjectIsolator isolator;

    auto isolated = isolator.isolateMesh(MeshPointer::New());
    ASSERT_FALSE(isolated.has_value());
    EXPECT_EQ(isolated.error().code, PipelineError::Code::NoTargetObject);
}

class ObjectIsolatorFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "dicom_mesher_isolator_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
};

TEST_F(ObjectIsolatorFileTest, IsolateFileRoundTrip) {
    auto input = dir_ / "skull_raw.stl";
    ASSERT_TRUE(writeMesh(test_utils::createSkullWithDebris(), input, STLFormat::Binary).has_value());

    ObjectIsolator isolator;
    auto output = dir_ / "skull.stl";
    auto result = isolator.isolate(input, output);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_EQ(result->outputPath, output);
    EXPECT_EQ(result->keptTriangles, 1000u);

    auto reread = readMesh(output);
    ASSERT_TRUE(reread.has_value());
    EXPECT_EQ((*reread)->GetNumberOfPolys(), 1000);
    EXPECT_EQ(ObjectIsolator::analyzeComponents(*reread).size(), 1u);
}

TEST_F(ObjectIsolatorFileTest, MissingInputIsStudyIO) {
    ObjectIsolator isolator;

    auto result = isolator.isolate(dir_ / "absent.stl", dir_ / "out.stl");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::StudyIO);
    EXPECT_FALSE(fs::exists(dir_ / "out.stl"));
}

}  // namespace
}  // namespace dicom_mesher::services
