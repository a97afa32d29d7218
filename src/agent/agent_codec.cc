#include "agent_codec.h"

#include "../common/errors.h"

namespace UpgradeJourney {

void ToProto(const PropertyValue& value, harness_agent::Value* out) {
	if (const auto* text = std::get_if<std::string>(&value)) {
		out->set_text_value(*text);
	} else {
		out->set_int_value(std::get<int64_t>(value));
	}
}

PropertyValue FromProto(const harness_agent::Value& value) {
	switch (value.kind_case()) {
		case harness_agent::Value::kTextValue:
			return value.text_value();
		case harness_agent::Value::kIntValue:
			return static_cast<int64_t>(value.int_value());
		case harness_agent::Value::KIND_NOT_SET:
			break;
	}
	throw ServiceError("property value without a kind");
}

void ToProto(const ClassSchema& schema, harness_agent::ClassSchema* out) {
	out->set_name(schema.name);
	for (const auto& def : schema.properties) {
		auto* property = out->add_properties();
		property->set_name(def.name);
		property->set_type(def.type == PropertyType::kText ? harness_agent::TEXT : harness_agent::INT);
	}
}

ClassSchema FromProto(const harness_agent::ClassSchema& schema) {
	ClassSchema result;
	result.name = schema.name();
	for (const auto& property : schema.properties()) {
		result.properties.push_back({property.name(),
				property.type() == harness_agent::TEXT ? PropertyType::kText : PropertyType::kInt});
	}
	return result;
}

void ToProto(const Properties& properties, google::protobuf::Map<std::string, harness_agent::Value>* out) {
	for (const auto& [name, value] : properties) {
		ToProto(value, &(*out)[name]);
	}
}

Properties FromProto(const google::protobuf::Map<std::string, harness_agent::Value>& properties) {
	Properties result;
	for (const auto& [name, value] : properties) {
		result[name] = FromProto(value);
	}
	return result;
}

} // End of namespace UpgradeJourney
