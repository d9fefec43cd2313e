#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>

#include "core/decision_engine.h"
#include "core/extension_normalizer.h"
#include "core/result_record.h"
#include "core/signature_table.h"
#include "core/sniffer.h"

using core::Action;
using core::DecisionEngine;
using core::DetectionOutcome;
using core::DetectionResult;
using core::FileVerdict;

namespace {

DetectionOutcome detected(const std::string& ext, double confidence, const std::string& mime = "x/x") {
    return DetectionOutcome::ok(DetectionResult{ext, mime, confidence, "test"});
}

// Existence probe over a fixed set of paths; counts calls.
struct FakeDisk {
    std::set<std::string> paths;
    mutable int probes = 0;

    core::PathExistsProbe probe() const {
        return [this](const std::string& p) {
            ++probes;
            return paths.count(p) > 0;
        };
    }
};

} // namespace

class DecisionEngineTest : public ::testing::Test {
protected:
    core::SignatureTable table_ = core::SignatureTable::builtin();
    core::Sniffer sniffer_{table_};
    core::ExtensionNormalizer normalizer_ = core::ExtensionNormalizer::builtin();
    DecisionEngine engine_{normalizer_, sniffer_.known_extensions()};
    FakeDisk disk_;
};

TEST_F(DecisionEngineTest, ReadErrorIsUnreadable) {
    FileVerdict v = engine_.decide("a.jpg", "jpg", DetectionOutcome::failed("EACCES"), true, disk_.probe());
    EXPECT_FALSE(v.is_match);
    EXPECT_EQ(v.action, Action::Error);
    EXPECT_EQ(v.reason, "unreadable");
    EXPECT_FALSE(v.new_path.has_value());
}

TEST_F(DecisionEngineTest, NoSignalIsInconclusiveNotMismatch) {
    FileVerdict v = engine_.decide("model.weights", "weights", detected("bin", 0.0), true, disk_.probe());
    EXPECT_TRUE(v.is_match);
    EXPECT_EQ(v.action, Action::None);
    EXPECT_EQ(v.reason, "inconclusive");
    EXPECT_EQ(disk_.probes, 0);
}

TEST_F(DecisionEngineTest, SameFamilyMatches) {
    FileVerdict v = engine_.decide("photo.JPEG", "JPEG", detected("jpg", 1.0), true, disk_.probe());
    EXPECT_TRUE(v.is_match);
    EXPECT_EQ(v.action, Action::None);
    EXPECT_EQ(v.reason, "match");
}

TEST_F(DecisionEngineTest, JsonFileWithJsonContentMatches) {
    FileVerdict v = engine_.decide("notes.json", "json", detected("json", 0.7), false, disk_.probe());
    EXPECT_TRUE(v.is_match);
    EXPECT_EQ(v.action, Action::None);
    EXPECT_EQ(v.reason, "match");
}

TEST_F(DecisionEngineTest, MismatchWithoutRenameOnlyReports) {
    FileVerdict v = engine_.decide("photo.txt", "txt", detected("png", 1.0), false, disk_.probe());
    EXPECT_FALSE(v.is_match);
    EXPECT_EQ(v.action, Action::None);
    EXPECT_EQ(v.reason, "mismatch-report-only");
    EXPECT_FALSE(v.new_path.has_value());
}

TEST_F(DecisionEngineTest, MismatchWithRenameProposesCanonicalExtension) {
    FileVerdict v = engine_.decide("photo.txt", "txt", detected("png", 1.0), true, disk_.probe());
    EXPECT_FALSE(v.is_match);
    EXPECT_EQ(v.action, Action::Rename);
    EXPECT_EQ(v.reason, "mismatch");
    EXPECT_EQ(v.new_path.value_or(""), "photo.png");
}

TEST_F(DecisionEngineTest, UnknownCurrentExtensionIsAMismatch) {
    FileVerdict v = engine_.decide("dir/archive.dat", "dat", detected("gz", 1.0), true, disk_.probe());
    EXPECT_FALSE(v.is_match);
    EXPECT_EQ(v.new_path.value_or(""), "dir/archive.gz");

    FileVerdict none = engine_.decide("dir/README", "", detected("txt", 0.4), true, disk_.probe());
    EXPECT_FALSE(none.is_match);
    EXPECT_EQ(none.new_path.value_or(""), "dir/README.txt");
}

TEST_F(DecisionEngineTest, CollisionPicksSmallestFreeSuffix) {
    disk_.paths = {"dir/data.png", "dir/data_1.png"};
    FileVerdict v = engine_.decide("dir/data.bin", "bin", detected("png", 1.0), true, disk_.probe());
    EXPECT_EQ(v.action, Action::Rename);
    EXPECT_EQ(v.new_path.value_or(""), "dir/data_2.png");
}

TEST_F(DecisionEngineTest, CollisionLawHoldsForAGap) {
    // data_2 is free even though data_3 exists: the first free index wins
    disk_.paths = {"data.png", "data_1.png", "data_3.png"};
    EXPECT_EQ(DecisionEngine::resolve_target("data.bin", "png", disk_.probe()), "data_2.png");
}

TEST_F(DecisionEngineTest, NoFreeNameIsAnErrorVerdict) {
    core::PathExistsProbe always = [](const std::string&) { return true; };
    auto outcome = detected("png", 1.0);
    FileVerdict v = engine_.decide("x.txt", "txt", outcome, true, always);
    EXPECT_EQ(v.action, Action::Error);
    EXPECT_EQ(v.reason, "no-free-name");
    EXPECT_FALSE(v.new_path.has_value());
    EXPECT_EQ(v.error, "no free name after 100000 candidates");

    // the report row says why, not just that it failed
    core::ResultRecord rec = core::build_record("x.txt", 48, "txt", outcome, v);
    EXPECT_EQ(rec.action, "error");
    EXPECT_EQ(rec.reason, "no-free-name");
    EXPECT_EQ(rec.error, "no free name after 100000 candidates");
}

TEST_F(DecisionEngineTest, IsoMediaPhotosAndAudioAreNotRenamedToMp4) {
    std::string heic_bytes = std::string("\0\0\0\x18" "ftypheic", 12) + std::string(20, '\0');
    auto heic_outcome = DetectionOutcome::ok(sniffer_.classify(heic_bytes, "heic"));
    FileVerdict heic = engine_.decide("IMG_0001.heic", "heic", heic_outcome, true, disk_.probe());
    EXPECT_TRUE(heic.is_match);
    EXPECT_EQ(heic.action, Action::None);
    EXPECT_FALSE(heic.new_path.has_value());

    std::string m4a_bytes = std::string("\0\0\0\x18" "ftypM4A ", 12) + std::string(20, '\0');
    auto m4a_outcome = DetectionOutcome::ok(sniffer_.classify(m4a_bytes, "m4a"));
    FileVerdict m4a = engine_.decide("song.m4a", "m4a", m4a_outcome, true, disk_.probe());
    EXPECT_TRUE(m4a.is_match);
    EXPECT_FALSE(m4a.new_path.has_value());
}

TEST_F(DecisionEngineTest, DetectedExtensionWithoutFamilyIsAnInvariantViolation) {
    EXPECT_THROW(engine_.decide("a.txt", "txt", detected("weird", 1.0), false, disk_.probe()),
                 core::InvariantError);
}

TEST_F(DecisionEngineTest, DecisionsAreDeterministic) {
    disk_.paths = {"a.png"};
    auto outcome = detected("png", 1.0);
    FileVerdict a = engine_.decide("a.gif", "gif", outcome, true, disk_.probe());
    FileVerdict b = engine_.decide("a.gif", "gif", outcome, true, disk_.probe());
    EXPECT_EQ(a.is_match, b.is_match);
    EXPECT_EQ(a.action, b.action);
    EXPECT_EQ(a.reason, b.reason);
    EXPECT_EQ(a.new_path, b.new_path);
    EXPECT_EQ(a.new_path.value_or(""), "a_1.png");
}

TEST(DecisionEngineSetupTest, RefusesExtensionsWithoutFamily) {
    auto normalizer = core::ExtensionNormalizer::builtin();
    EXPECT_THROW(DecisionEngine(normalizer, {"png", "jxl"}), std::invalid_argument);
    EXPECT_NO_THROW(DecisionEngine(normalizer, {"png", "jpeg"}));
}

TEST(ActionNameTest, Names) {
    EXPECT_STREQ(core::action_name(Action::None), "none");
    EXPECT_STREQ(core::action_name(Action::Rename), "rename");
    EXPECT_STREQ(core::action_name(Action::Error), "error");
}
