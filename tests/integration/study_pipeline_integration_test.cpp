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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <itkImageFileWriter.h>

#include "services/mesh/mesh_io.hpp"
#include "services/mesh/object_isolator.hpp"
#include "services/pipeline/pipeline_config.hpp"
#include "services/pipeline/study_pipeline.hpp"

#include "../test_utils/volume_generator.hpp"
#include "../test_utils/zip_fixture.hpp"

using namespace dicom_mesher::services;
namespace test_utils = dicom_mesher::test_utils;
namespace fs = std::filesystem;

namespace {

PipelineConfig configFor(const ConfigOverrides& overrides)
{
    auto config = resolvePipelineConfig(overrides);
    EXPECT_TRUE(config.has_value());
    return config.value_or(PipelineConfig{});
}

std::string readText(const fs::path& path)
{
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

class StudyPipelineIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "dicom_mesher_pipeline_integration_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path writeVolume(test_utils::ShortImageType::Pointer volume, const std::string& name) {
        auto path = dir_ / name;
        auto writer = itk::ImageFileWriter<test_utils::ShortImageType>::New();
        writer->SetFileName(path.string());
        writer->SetInput(volume);
        writer->Update();
        return path;
    }

    fs::path dir_;
    StudyPipeline pipeline_;
};

// =============================================================================
// Volume file input
// =============================================================================

TEST_F(StudyPipelineIntegrationTest, BoneTissueGivesOneClosedObject) {
    auto input = writeVolume(test_utils::createBoneSphereVolume(48, 14.0), "head.mha");
    ConfigOverrides overrides;
    overrides.tissue = "bone";

    auto output = dir_ / "skull.stl";
    auto result = pipeline_.run(input, output, configFor(overrides));
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_EQ(result->inputKind, StudyInputKind::VolumeFile);
    EXPECT_EQ(result->inputSize[0], 48u);
    EXPECT_GT(result->triangleCount, 0u);
    EXPECT_FALSE(result->volumeInfoPath.has_value());

    auto mesh = readMesh(output);
    ASSERT_TRUE(mesh.has_value());
    EXPECT_EQ(ObjectIsolator::analyzeComponents(*mesh).size(), 1u);

    // Physical placement survives shrink-free preprocessing and padding
    const auto& box = result->statistics.boundingBox;
    EXPECT_NEAR((box[0] + box[1]) / 2.0, 24.0, 1.5);
    EXPECT_NEAR(box[1] - box[0], 28.0, 4.0);
}

TEST_F(StudyPipelineIntegrationTest, ExplicitIsoValueOnRawIntensities) {
    auto input = writeVolume(test_utils::createBoneSphereVolume(32, 9.0), "head.mha");
    ConfigOverrides overrides;
    overrides.isoValue = 300.0;
    overrides.reduction = 0.5;

    auto output = dir_ / "skull.ply";
    auto result = pipeline_.run(input, output, configFor(overrides));
    ASSERT_TRUE(result.has_value()) << result.error().toString();
    EXPECT_TRUE(fs::exists(output));
    EXPECT_NEAR(result->statistics.boundingBox[1] - result->statistics.boundingBox[0], 18.0, 3.0);
}

TEST_F(StudyPipelineIntegrationTest, NonPositiveIsoValueMeshesOnlyTheObject) {
    auto input = writeVolume(test_utils::createBoneSphereVolume(32, 9.0), "head.mha");

    for (double iso : {0.0, -500.0}) {
        ConfigOverrides overrides;
        overrides.isoValue = iso;
        overrides.reduction = 0.5;

        auto output = dir_ / (iso == 0.0 ? "iso_zero.stl" : "iso_skin.stl");
        auto result = pipeline_.run(input, output, configFor(overrides));
        ASSERT_TRUE(result.has_value()) << result.error().toString();

        auto mesh = readMesh(output);
        ASSERT_TRUE(mesh.has_value());
        EXPECT_EQ(ObjectIsolator::analyzeComponents(*mesh).size(), 1u) << "iso " << iso;

        // The padded border must not become a box around the scan
        const auto& box = result->statistics.boundingBox;
        EXPECT_NEAR(box[1] - box[0], 18.0, 3.0) << "iso " << iso;
        EXPECT_NEAR(box[5] - box[4], 18.0, 3.0) << "iso " << iso;
    }
}

TEST_F(StudyPipelineIntegrationTest, ShrinkKeepsPhysicalSize) {
    auto input = writeVolume(test_utils::createBoneSphereVolume(64, 20.0, 0.5), "fine.mha");
    ConfigOverrides overrides;
    overrides.tissue = "bone";
    overrides.shrinkMaxDimension = 32;

    auto result = pipeline_.run(input, dir_ / "coarse.stl", configFor(overrides));
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    // Radius 20 voxels at 0.5 mm is 10 mm regardless of the working grid
    const auto& box = result->statistics.boundingBox;
    EXPECT_NEAR(box[1] - box[0], 20.0, 3.0);
    EXPECT_DOUBLE_EQ(result->inputSpacing[0], 0.5);
}

TEST_F(StudyPipelineIntegrationTest, VolumeInfoSidecarDescribesInput) {
    auto volume = test_utils::createSphereVolume(
        24, 7.0, test_utils::kBoneHU, test_utils::kAirHU, 0.75);
    auto input = writeVolume(volume, "head.mha");
    ConfigOverrides overrides;
    overrides.tissue = "bone";
    overrides.writeVolumeInfo = true;

    auto output = dir_ / "skull.stl";
    auto result = pipeline_.run(input, output, configFor(overrides));
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    const auto infoPath = dir_ / "skull.volume.txt";
    ASSERT_TRUE(result->volumeInfoPath.has_value());
    EXPECT_EQ(*result->volumeInfoPath, infoPath);
    EXPECT_EQ(StudyPipeline::volumeInfoPathFor(output), infoPath);

    EXPECT_EQ(readText(infoPath),
              "xdimension 24\nydimension 24\nzdimension 24\n"
              "xspacing 0.75\nyspacing 0.75\nzspacing 0.75\n");
}

TEST_F(StudyPipelineIntegrationTest, FailedVolumeInfoRemovesMesh) {
    auto input = writeVolume(test_utils::createBoneSphereVolume(24, 7.0), "head.mha");
    ConfigOverrides overrides;
    overrides.tissue = "bone";
    overrides.writeVolumeInfo = true;

    // A directory where the sidecar should go cannot be opened for writing
    auto output = dir_ / "skull.stl";
    fs::create_directories(StudyPipeline::volumeInfoPathFor(output));

    auto result = pipeline_.run(input, output, configFor(overrides));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().stage, "write_volume_info");
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(StudyPipelineIntegrationTest, VolumeFileIsNotCT) {
    auto input = writeVolume(test_utils::createBoneSphereVolume(16, 4.0), "head.mha");
    ConfigOverrides overrides;
    overrides.tissue = "bone";
    overrides.requireCT = true;

    auto output = dir_ / "skull.stl";
    auto result = pipeline_.run(input, output, configFor(overrides));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().stage, "modality_check");
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(StudyPipelineIntegrationTest, EmptyVolumeFailsAtExtraction) {
    auto volume = test_utils::createVolume(16);
    volume->FillBuffer(test_utils::kAirHU);
    auto input = writeVolume(volume, "air.mha");
    ConfigOverrides overrides;
    overrides.tissue = "bone";

    auto output = dir_ / "nothing.stl";
    auto result = pipeline_.run(input, output, configFor(overrides));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::MeshStage);
    EXPECT_FALSE(fs::exists(output));
}

// =============================================================================
// Input resolution
// =============================================================================

TEST_F(StudyPipelineIntegrationTest, MissingInput) {
    auto result = pipeline_.run(dir_ / "absent", dir_ / "out.stl", PipelineConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::StudyIO);
    EXPECT_EQ(result.error().stage, "resolve_input");
}

TEST_F(StudyPipelineIntegrationTest, DirectoryWithoutDicom) {
    fs::create_directories(dir_ / "empty_study");
    std::ofstream(dir_ / "empty_study" / "notes.txt") << "no images here";

    auto result = pipeline_.run(dir_ / "empty_study", dir_ / "out.stl", PipelineConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().stage, "read_series");
}

TEST_F(StudyPipelineIntegrationTest, ZipEscapingEntryIsRejected) {
    auto zip = dir_ / "study.zip";
    ASSERT_TRUE(test_utils::writeZip(zip, {{"../IM0001.dcm", "DICM"}}));

    auto result = pipeline_.run(zip, dir_ / "out.stl", PipelineConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().stage, "extract_zip");
    EXPECT_FALSE(fs::exists(dir_.parent_path() / "IM0001.dcm"));
}
