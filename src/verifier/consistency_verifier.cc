#include "consistency_verifier.h"

#include <variant>

#include <glog/logging.h>

#include "../common/config.h"
#include "../common/errors.h"

namespace UpgradeJourney {

namespace {

const std::string* GetText(const DataObject& object, const char* name) {
    auto it = object.properties.find(name);
    if (it == object.properties.end()) {
        return nullptr;
    }
    return std::get_if<std::string>(&it->second);
}

const int64_t* GetInt(const DataObject& object, const char* name) {
    auto it = object.properties.find(name);
    if (it == object.properties.end()) {
        return nullptr;
    }
    return std::get_if<int64_t>(&it->second);
}

} // namespace

ConsistencyVerifier::ConsistencyVerifier(DataClient& client, std::string class_name,
                                         RetryPolicy visibility, Clock& clock)
    : client_(client), class_name_(std::move(class_name)), visibility_(visibility, clock) {}

ConsistencyVerifier::Lookup ConsistencyVerifier::LookupStep(const VersionSequence& sequence,
                                                            size_t step, size_t upto) {
    const std::string& version = sequence[step];
    const size_t expected_matches = sequence.OccurrencesUpTo(version, upto);

    auto objects = client_.Query(class_name_, EqualityFilter{kVersionProperty, version},
                                 {kVersionProperty, kObjectCountProperty});

    bool step_record_found = false;
    for (const auto& object : objects) {
        const std::string* actual_version = GetText(object, kVersionProperty);
        if (actual_version == nullptr) {
            throw DataLossError(version, "object " + object.id + " has no text '" + kVersionProperty + "' field");
        }
        if (*actual_version != version) {
            throw DataLossError(version, "wanted " + version + " got " + *actual_version);
        }
        const int64_t* count = GetInt(object, kObjectCountProperty);
        if (count == nullptr) {
            throw DataLossError(version, "object " + object.id + " has no integer '" +
                                kObjectCountProperty + "' field");
        }
        if (*count == static_cast<int64_t>(step)) {
            step_record_found = true;
        }
    }

    if (objects.size() > expected_matches) {
        throw DataLossError(version, "expected " + std::to_string(expected_matches) + " record(s), found " +
                            std::to_string(objects.size()));
    }
    if (!step_record_found) {
        VLOG(2) << "Record of step " << step << " (" << version << ") not visible yet, "
                << objects.size() << "/" << expected_matches << " match(es)";
        return Lookup::kNotVisible;
    }
    return Lookup::kFound;
}

size_t ConsistencyVerifier::FindEachImportedObject(const VersionSequence& sequence, size_t upto) {
    if (upto >= sequence.size()) {
        throw SequenceError("cannot verify up to step " + std::to_string(upto) + " of a sequence of " +
                            std::to_string(sequence.size()));
    }

    size_t confirmed = 0;
    for (size_t step = 0; step <= upto; ++step) {
        const std::string& version = sequence[step];
        bool found = visibility_.Poll([&]() {
            return LookupStep(sequence, step, upto) == Lookup::kFound;
        }, "find " + class_name_ + " object of step " + std::to_string(step) + " (" + version + ")");
        if (!found) {
            throw DataLossError(version, "record written at step " + std::to_string(step) +
                                " not retrievable after " + std::to_string(visibility_.policy().max_attempts) +
                                " read(s) over " + std::to_string(visibility_.policy().TotalBudget().count()) +
                                "ms");
        }
        VLOG(1) << "Found record of step " << step << " version=" << version;
        confirmed++;
    }
    return confirmed;
}

void ConsistencyVerifier::AggregateObjects(int64_t expected) {
    int64_t actual = 0;
    bool matched = visibility_.Poll([&]() {
        actual = client_.Aggregate(class_name_);
        if (actual > expected) {
            throw AggregateMismatchError(expected, actual);
        }
        return actual == expected;
    }, "aggregate " + class_name_);
    if (!matched) {
        throw AggregateMismatchError(expected, actual);
    }
    VLOG(1) << "Aggregate count of " << class_name_ << " = " << actual;
}

} // namespace UpgradeJourney
