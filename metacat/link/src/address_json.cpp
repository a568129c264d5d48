#include "../include/address_json.hpp"


namespace metacat::link {


    void to_json(nlohmann::json& j, const Address& a) {
        j = nlohmann::json::object();
        j["kind"] = toString(a.kind());
        j["entityType"] = a.entityType();
        j["entityFQN"] = a.entityFqn();
        if (a.fieldName())       j["fieldName"] = *a.fieldName();
        if (a.arrayFieldName())  j["arrayFieldName"] = *a.arrayFieldName();
        if (a.arrayFieldValue()) j["arrayFieldValue"] = *a.arrayFieldValue();
        j["qualifiedType"] = a.qualifiedType();
        j["qualifiedValue"] = a.qualifiedValue();
    }


    static std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }


    Expected<Address> addressFromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            return Expected<Address>::failure(ErrorCode::malformedAddress, "Entity link JSON must be an object: " + j.dump());
        }

        auto type = optionalString(j, "entityType");
        auto fqn = optionalString(j, "entityFQN");
        if (!type || !fqn) {
            return Expected<Address>::failure(ErrorCode::malformedAddress, "Entity link JSON must have both entityType and entityFQN: " + j.dump());
        }

        return Address::make(std::move(*type), std::move(*fqn),
            optionalString(j, "fieldName"), optionalString(j, "arrayFieldName"), optionalString(j, "arrayFieldValue"));
    }


} // namespace metacat::link
