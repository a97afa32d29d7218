#ifndef UPGRADE_JOURNEY_SRC_VERIFIER_CONSISTENCY_VERIFIER_H_
#define UPGRADE_JOURNEY_SRC_VERIFIER_CONSISTENCY_VERIFIER_H_

#include <cstdint>
#include <string>

#include "../cluster/version_sequence.h"
#include "../common/interfaces.h"
#include "../common/retry.h"

namespace UpgradeJourney {

/**
 * Read-only checks run after every step. Both checks are re-run in full each
 * time; the service is never mutated. Records that are not visible yet are
 * re-read under the visibility retry policy before they count as lost.
 */
class ConsistencyVerifier {
public:
    ConsistencyVerifier(DataClient& client, std::string class_name, RetryPolicy visibility,
                        Clock& clock = DefaultClock());

    // Checks the record written at every step 0..upto is retrievable by its
    // version and unchanged. Returns the number of records confirmed.
    // Throws DataLossError naming the first version that fails.
    size_t FindEachImportedObject(const VersionSequence& sequence, size_t upto);

    // Throws AggregateMismatchError unless the service counts expected objects.
    void AggregateObjects(int64_t expected);

private:
    enum class Lookup {
        kFound,
        kNotVisible,
    };

    Lookup LookupStep(const VersionSequence& sequence, size_t step, size_t upto);

    DataClient& client_;
    std::string class_name_;
    Retrier visibility_;
};

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_SRC_VERIFIER_CONSISTENCY_VERIFIER_H_
