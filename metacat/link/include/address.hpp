#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include "expected.hpp"


namespace metacat::link {


    enum class LinkKind { entity, field, arrayField };

    const char* toString(LinkKind kind);


    /**
     * @brief Immutable reference to an entity, one of its fields, or a member of an array field.
     *
     * Examples (canonical form):
     *  - <#E/table/db.t1>                        -> entity
     *  - <#E/table/db.t1/description>            -> field
     *  - <#E/table/db.t1/columns/comment>        -> arrayField
     *  - <#E/table/db.t1/columns/comment/tags>   -> arrayField with value
     */
    class Address 
    {
    public:
        /**
         * @brief Assemble an address from its segments.
         * Empty optional segments are treated as absent. Fails with malformedAddress when
         * entityType/entityFqn are missing or a segment carries a delimiter, and with
         * invalidSegmentOrder when an array segment is given without its parent segment.
         */
        static Expected<Address> make(std::string entityType, std::string entityFqn,
            std::optional<std::string> fieldName = std::nullopt,
            std::optional<std::string> arrayFieldName = std::nullopt,
            std::optional<std::string> arrayFieldValue = std::nullopt);

        const std::string& entityType() const noexcept { return entityType_; }
        const std::string& entityFqn() const noexcept { return entityFqn_; }
        const std::optional<std::string>& fieldName() const noexcept { return fieldName_; }
        const std::optional<std::string>& arrayFieldName() const noexcept { return arrayFieldName_; }
        const std::optional<std::string>& arrayFieldValue() const noexcept { return arrayFieldValue_; }

        LinkKind kind() const noexcept { return kind_; }

        // "table.columns.member" style shape of the referenced path
        const std::string& qualifiedType() const noexcept { return qualifiedType_; }
        // "db.t1.comment.tags" style concrete referenced path
        const std::string& qualifiedValue() const noexcept { return qualifiedValue_; }

        std::string toString() const;

        bool operator==(const Address&) const = default;

    private:
        Address() = default;

        LinkKind kind_{LinkKind::entity};
        std::string entityType_;
        std::string entityFqn_;
        std::optional<std::string> fieldName_;
        std::optional<std::string> arrayFieldName_;
        std::optional<std::string> arrayFieldValue_;
        std::string qualifiedType_;
        std::string qualifiedValue_;
    };


} // namespace metacat::link


namespace std {

    template <>
    struct hash<metacat::link::Address> 
    {
        std::size_t operator()(const metacat::link::Address& a) const noexcept;
    };

} // namespace std
