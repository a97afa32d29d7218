#ifndef UPGRADE_JOURNEY_SRC_CLUSTER_VERSION_SEQUENCE_H_
#define UPGRADE_JOURNEY_SRC_CLUSTER_VERSION_SEQUENCE_H_

#include <cstddef>
#include <string>
#include <vector>

namespace UpgradeJourney {

/**
 * Ordered upgrade path. The first entry is the bootstrap version, every later
 * entry is a rolling-update target applied strictly in order. Repeated entries
 * are allowed and repeat a step.
 */
class VersionSequence {
	public:
		// Throws SequenceError when versions is empty or holds an empty string.
		explicit VersionSequence(std::vector<std::string> versions);

		size_t size() const { return versions_.size(); }
		const std::string& at(size_t index) const;
		const std::string& operator[](size_t index) const { return versions_[index]; }

		const std::string& Bootstrap() const { return versions_.front(); }

		// Number of times version appears among the entries [0, upto].
		size_t OccurrencesUpTo(const std::string& version, size_t upto) const;

		std::string ToString() const;

	private:
		std::vector<std::string> versions_;
};

} // End of namespace UpgradeJourney
#endif
