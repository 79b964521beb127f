#include "services/pipeline/study_organizer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace dicom_mesher::services {
namespace {

namespace fs = std::filesystem;

class StudyOrganizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "dicom_mesher_organizer_test";
        fs::remove_all(root_);
        source_ = root_ / "incoming";
        output_ = root_ / "sorted";
        fs::create_directories(source_);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    /// Create a placeholder file and register the header the reader reports for it
    void addFile(const fs::path& dir, const std::string& name,
                 const std::string& seriesUid,
                 const std::string& modality = "CT",
                 const std::string& bodyPart = "HEAD") {
        fs::create_directories(dir);
        std::ofstream(dir / name) << "DICM";
        core::DicomMetadata metadata;
        metadata.seriesInstanceUid = seriesUid;
        metadata.modality = modality;
        metadata.bodyPartExamined = bodyPart;
        headers_[name] = metadata;
    }

    StudyOrganizer::MetadataReader tableReader() {
        return [this](const fs::path& file)
                   -> std::expected<core::DicomMetadata, core::DicomErrorInfo> {
            reads_.push_back(file.filename().string());
            auto it = headers_.find(file.filename().string());
            if (it == headers_.end()) {
                return std::unexpected(core::DicomErrorInfo{
                    core::DicomError::InvalidDicomFormat, file.string()});
            }
            return it->second;
        };
    }

    fs::path root_;
    fs::path source_;
    fs::path output_;
    std::map<std::string, core::DicomMetadata> headers_;
    std::vector<std::string> reads_;
};

TEST_F(StudyOrganizerTest, DefaultLedgerLivesInOutputDirectory) {
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());
    EXPECT_EQ(organizer.ledgerPathFor("/sorted"), fs::path("/sorted/organized_dcms.json"));

    OrganizeOptions options;
    options.ledgerPath = "/var/ledger.json";
    StudyOrganizer custom(options, tableReader());
    EXPECT_EQ(custom.ledgerPathFor("/sorted"), fs::path("/var/ledger.json"));
}

TEST_F(StudyOrganizerTest, MovesMatchingFilesIntoSeriesDirectories) {
    addFile(source_, "a1.dcm", "1.2.3");
    addFile(source_, "a2.dcm", "1.2.3");
    addFile(source_, "b1.dcm", "1.2.4");
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());

    auto summary = organizer.organize(source_, output_);
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();

    EXPECT_EQ(summary->examined, 3u);
    EXPECT_EQ(summary->moved, 3u);
    EXPECT_EQ(summary->errors, 0u);
    EXPECT_EQ(summary->seriesUids, (std::set<std::string>{"1.2.3", "1.2.4"}));

    EXPECT_TRUE(fs::exists(output_ / "1.2.3" / "a1.dcm"));
    EXPECT_TRUE(fs::exists(output_ / "1.2.3" / "a2.dcm"));
    EXPECT_TRUE(fs::exists(output_ / "1.2.4" / "b1.dcm"));
    EXPECT_FALSE(fs::exists(source_ / "a1.dcm"));
}

TEST_F(StudyOrganizerTest, FilterLeavesOtherStudiesInPlace) {
    addFile(source_, "head.dcm", "1.1");
    addFile(source_, "chest.dcm", "1.2", "CT", "CHEST");
    addFile(source_, "mr.dcm", "1.3", "MR", "HEAD");
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());

    auto summary = organizer.organize(source_, output_);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->moved, 1u);
    EXPECT_EQ(summary->filteredOut, 2u);
    EXPECT_TRUE(fs::exists(source_ / "chest.dcm"));
    EXPECT_TRUE(fs::exists(source_ / "mr.dcm"));
    EXPECT_FALSE(fs::exists(output_ / "1.2"));
}

TEST_F(StudyOrganizerTest, CustomFilter) {
    addFile(source_, "chest.dcm", "1.2", "CT", "CHEST");
    OrganizeOptions options;
    options.bodyPart = "CHEST";
    StudyOrganizer organizer(options, tableReader());

    auto summary = organizer.organize(source_, output_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->moved, 1u);
    EXPECT_TRUE(fs::exists(output_ / "1.2" / "chest.dcm"));
}

TEST_F(StudyOrganizerTest, UnreadableFilesCountAsErrors) {
    addFile(source_, "good.dcm", "1.1");
    std::ofstream(source_ / "garbage.bin") << "not dicom";
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());

    auto summary = organizer.organize(source_, output_);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->examined, 2u);
    EXPECT_EQ(summary->errors, 1u);
    EXPECT_EQ(summary->moved, 1u);
    EXPECT_TRUE(fs::exists(source_ / "garbage.bin"));
}

TEST_F(StudyOrganizerTest, MissingSeriesUidIsAnError) {
    addFile(source_, "nouid.dcm", "");
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());

    auto summary = organizer.organize(source_, output_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->errors, 1u);
    EXPECT_EQ(summary->moved, 0u);
    EXPECT_TRUE(fs::exists(source_ / "nouid.dcm"));
}

TEST_F(StudyOrganizerTest, LedgerSkipsFilesSeenBefore) {
    addFile(source_, "chest.dcm", "1.2", "CT", "CHEST");
    addFile(source_, "head.dcm", "1.1");
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());

    ASSERT_TRUE(organizer.organize(source_, output_).has_value());
    EXPECT_TRUE(fs::exists(output_ / "organized_dcms.json"));

    reads_.clear();
    addFile(source_, "late.dcm", "1.1");
    auto second = organizer.organize(source_, output_);
    ASSERT_TRUE(second.has_value());

    // The filtered chest file stays in the source but is not read again
    EXPECT_EQ(reads_, (std::vector<std::string>{"late.dcm"}));
    EXPECT_EQ(second->examined, 1u);
    EXPECT_EQ(second->moved, 1u);
}

TEST_F(StudyOrganizerTest, LedgerRoundTrip) {
    auto path = root_ / "ledger.json";
    ASSERT_TRUE(StudyOrganizer::saveLedger(path, {"x.dcm", "y.dcm"}).has_value());

    auto names = StudyOrganizer::loadLedger(path);
    ASSERT_TRUE(names.has_value());
    EXPECT_EQ(*names, (std::set<std::string>{"x.dcm", "y.dcm"}));
}

TEST_F(StudyOrganizerTest, MissingLedgerIsEmpty) {
    auto names = StudyOrganizer::loadLedger(root_ / "absent.json");
    ASSERT_TRUE(names.has_value());
    EXPECT_TRUE(names->empty());
}

TEST_F(StudyOrganizerTest, CorruptLedgerIsRejected) {
    auto path = root_ / "ledger.json";
    std::ofstream(path) << "{not json";

    auto names = StudyOrganizer::loadLedger(path);
    ASSERT_FALSE(names.has_value());
    EXPECT_EQ(names.error().code, PipelineError::Code::StudyIO);
    EXPECT_EQ(names.error().stage, "read_ledger");
}

TEST_F(StudyOrganizerTest, RecursesIntoSubdirectories) {
    addFile(source_ / "disc1", "a.dcm", "7.7");
    addFile(source_ / "disc2", "b.dcm", "7.8");
    addFile(source_, "top.dcm", "7.9");
    OrganizeOptions options;
    options.recurseSubdirectories = true;
    StudyOrganizer organizer(options, tableReader());

    auto summary = organizer.organize(source_, output_);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->moved, 2u);
    EXPECT_TRUE(fs::exists(output_ / "7.7" / "a.dcm"));
    EXPECT_TRUE(fs::exists(output_ / "7.8" / "b.dcm"));
    EXPECT_TRUE(fs::exists(source_ / "top.dcm"));
}

TEST_F(StudyOrganizerTest, MissingSourceFails) {
    StudyOrganizer organizer(OrganizeOptions{}, tableReader());

    auto summary = organizer.organize(root_ / "absent", output_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, PipelineError::Code::StudyIO);
}

}  // namespace
}  // namespace dicom_mesher::services
