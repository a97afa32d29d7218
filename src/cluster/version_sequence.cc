#include "version_sequence.h"

#include <algorithm>

#include "absl/strings/str_join.h"

#include "../common/errors.h"

namespace UpgradeJourney {

VersionSequence::VersionSequence(std::vector<std::string> versions)
	: versions_(std::move(versions)) {
	if (versions_.empty()) {
		throw SequenceError("sequence must be non-empty");
	}
	for (size_t i = 0; i < versions_.size(); ++i) {
		if (versions_[i].empty()) {
			throw SequenceError("version at position " + std::to_string(i) + " is empty");
		}
	}
}

const std::string& VersionSequence::at(size_t index) const {
	if (index >= versions_.size()) {
		throw SequenceError("step " + std::to_string(index) + " is past the end of a sequence of " +
				std::to_string(versions_.size()));
	}
	return versions_[index];
}

size_t VersionSequence::OccurrencesUpTo(const std::string& version, size_t upto) const {
	size_t last = std::min(upto + 1, versions_.size());
	return static_cast<size_t>(std::count(versions_.begin(), versions_.begin() + last, version));
}

std::string VersionSequence::ToString() const {
	return "[" + absl::StrJoin(versions_, ", ") + "]";
}

} // End of namespace UpgradeJourney
