#include <gtest/gtest.h>
#include "../../src/cluster/version_sequence.h"
#include "../../src/common/errors.h"

using namespace UpgradeJourney;

TEST(VersionSequenceTest, RejectsEmptySequence) {
	try {
		VersionSequence sequence(std::vector<std::string>{});
		FAIL() << "expected SequenceError";
	} catch (const SequenceError& e) {
		EXPECT_EQ(e.kind(), ErrorKind::kSequence);
		EXPECT_STREQ(e.what(), "sequence must be non-empty");
	}
}

TEST(VersionSequenceTest, RejectsEmptyEntry) {
	EXPECT_THROW(VersionSequence({"1.0", "", "1.2"}), SequenceError);
}

TEST(VersionSequenceTest, BootstrapIsFirstEntry) {
	VersionSequence sequence({"1.16.0", "1.16.1", "1.17.0"});
	EXPECT_EQ(sequence.size(), 3u);
	EXPECT_EQ(sequence.Bootstrap(), "1.16.0");
	EXPECT_EQ(sequence[2], "1.17.0");
	EXPECT_EQ(sequence.ToString(), "[1.16.0, 1.16.1, 1.17.0]");
}

TEST(VersionSequenceTest, SingleEntryIsBootstrapOnly) {
	VersionSequence sequence({"1.0"});
	EXPECT_EQ(sequence.size(), 1u);
	EXPECT_EQ(sequence.Bootstrap(), "1.0");
}

TEST(VersionSequenceTest, AtPastTheEndThrows) {
	VersionSequence sequence({"1.0", "1.1"});
	EXPECT_EQ(sequence.at(1), "1.1");
	EXPECT_THROW(sequence.at(2), SequenceError);
}

TEST(VersionSequenceTest, RepeatedVersionsAreCountedPerWindow) {
	VersionSequence sequence({"1.0", "1.1", "1.1", "1.2", "1.1"});
	EXPECT_EQ(sequence.OccurrencesUpTo("1.1", 0), 0u);
	EXPECT_EQ(sequence.OccurrencesUpTo("1.1", 1), 1u);
	EXPECT_EQ(sequence.OccurrencesUpTo("1.1", 2), 2u);
	EXPECT_EQ(sequence.OccurrencesUpTo("1.1", 4), 3u);
	// Window clamps to the sequence end
	EXPECT_EQ(sequence.OccurrencesUpTo("1.1", 40), 3u);
	EXPECT_EQ(sequence.OccurrencesUpTo("9.9", 4), 0u);
}
