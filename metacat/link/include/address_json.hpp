#pragma once
#include <nlohmann/json.hpp>
#include "address.hpp"
#include "expected.hpp"


namespace metacat::link {

    /**
     * @brief JSON view of an address, e.g.
     * {"kind":"FIELD","entityType":"table","entityFQN":"db.t1","fieldName":"description",
     *  "qualifiedType":"table.description","qualifiedValue":"db.t1.description"}
     * Absent optional segments are omitted.
     */
    void to_json(nlohmann::json& j, const Address& a);

    // Rebuilds an address from the segment keys of to_json's output; derived keys are ignored
    Expected<Address> addressFromJson(const nlohmann::json& j);

} // namespace metacat::link
