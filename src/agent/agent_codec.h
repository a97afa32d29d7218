#ifndef UPGRADE_JOURNEY_SRC_AGENT_AGENT_CODEC_H_
#define UPGRADE_JOURNEY_SRC_AGENT_AGENT_CODEC_H_

#include <harness_agent.pb.h>

#include "../common/interfaces.h"

namespace UpgradeJourney {

// Conversions between the agent wire messages and the capability types.

void ToProto(const PropertyValue& value, harness_agent::Value* out);
// Throws ServiceError when the value carries no kind.
PropertyValue FromProto(const harness_agent::Value& value);

void ToProto(const ClassSchema& schema, harness_agent::ClassSchema* out);
ClassSchema FromProto(const harness_agent::ClassSchema& schema);

void ToProto(const Properties& properties, google::protobuf::Map<std::string, harness_agent::Value>* out);
Properties FromProto(const google::protobuf::Map<std::string, harness_agent::Value>& properties);

} // End of namespace UpgradeJourney
#endif
